/**
 * @file movement.hpp
 * @brief System for advancing every moving entity by its velocity
 *
 * This system handles:
 * - Position updates using velocity (one substep, no delta-time scaling)
 * - Clamping positions to the field plus the overscan margin
 *
 * Required components:
 * - Transform (to modify)
 */

#pragma once

#include "gunpong/systems/i_system.hpp"

namespace Systems {

/**
 * @class MovementSystem
 * @brief Integrates positions for balls, bullets and paddles alike
 */
class MovementSystem : public ISystem {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    /**
     * @brief Moves all Transforms by one substep
     * @param ctx Frame state; uses the store and the field size from config
     */
    void update(FrameContext& ctx) override;
};

} // namespace Systems
