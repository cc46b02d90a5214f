/**
 * @file control.hpp
 * @brief System turning input and AI decisions into paddle acceleration
 *
 * This system handles:
 * - Velocity damping for every controlled paddle
 * - Player steering and firing (with per-paddle cooldown)
 * - AI tracking of the nearest ball
 * - A faint trail particle behind each paddle
 *
 * Required components:
 * - Transform (to modify)
 * - ControlType (to read, PlayerControl cooldown is written)
 */

#pragma once

#include <vector>

#include "gunpong/components/basic.hpp"
#include "gunpong/components/control.hpp"
#include "gunpong/systems/i_system.hpp"

namespace Systems {

/**
 * @class ControlSystem
 * @brief Applies one substep of control to every paddle
 */
class ControlSystem : public ISystem {
public:
    ControlSystem() = default;
    ~ControlSystem() override = default;

    void update(FrameContext& ctx) override;

    /**
     * @brief Vertical acceleration the AI applies this substep
     *
     * Picks the ball with the smallest squared distance (the first one wins a
     * tie) and accelerates towards its height, harder the further away it is.
     *
     * @param paddle Paddle position
     * @param balls Ball positions
     * @param config Supplies the response factor, limit and field width
     * @return Acceleration along y, 0 when there are no balls
     */
    static float aiAcceleration(const Vector& paddle,
                                const std::vector<Vector>& balls,
                                const GameConfig& config);

private:
    struct PendingBullet {
        Entity shooter;
        Components::Transform transform;
        float direction;
    };

    void applyPlayer(FrameContext& ctx,
                     Entity entity,
                     Components::Transform& transform,
                     Components::PlayerControl& control,
                     std::vector<PendingBullet>& bullets);
};

} // namespace Systems
