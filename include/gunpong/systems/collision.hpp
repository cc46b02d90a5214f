/**
 * @file collision.hpp
 * @brief Detection and response for bullets, balls, paddles and field edges
 *
 * This system handles, once per substep and in this order:
 * - Bullet vs ball: knocks the ball away from the bullet at its current speed
 * - Bullet vs paddle: shortens the paddle capsule by one unit
 * - Removal of spent bullets (and of bullets parked on the overscan edge)
 * - Goals, wall bounces and ball vs paddle deflection
 * - The per-frame intensity value and the ball trail
 *
 * All tests read value snapshots taken at the start of the pass, so a
 * response applied earlier in the pass never changes what a later test sees.
 *
 * Required components:
 * - Transform + Ball, Transform + Bullet, Transform + Bounds
 */

#pragma once

#include <vector>

#include "gunpong/components/basic.hpp"
#include "gunpong/systems/i_system.hpp"

namespace Systems {

/**
 * @class CollisionSystem
 * @brief Resolves every interaction between simulated bodies
 */
class CollisionSystem : public ISystem {
public:
    CollisionSystem() = default;
    ~CollisionSystem() override = default;

    void update(FrameContext& ctx) override;

private:
    struct BallSnapshot {
        Entity entity;
        Components::Transform transform;
        Components::Ball ball;
    };

    struct BulletSnapshot {
        Entity entity;
        Components::Transform transform;
        Components::Bullet bullet;
    };

    struct PaddleSnapshot {
        Entity entity;
        Components::Transform transform;
        Components::Bounds bounds;
    };

    void resolveBullets(FrameContext& ctx,
                        const std::vector<BulletSnapshot>& bullets,
                        const std::vector<BallSnapshot>& balls,
                        const std::vector<PaddleSnapshot>& paddles);

    void resolveBalls(FrameContext& ctx, const std::vector<PaddleSnapshot>& paddles);
};

} // namespace Systems
