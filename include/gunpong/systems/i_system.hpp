/**
 * @file i_system.hpp
 * @brief Interface for all gameplay systems
 */

#pragma once

#include "gunpong/systems/frame_context.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all systems
 *
 * Systems hold no session state of their own; everything they read or write
 * arrives through the FrameContext. Game decides how often each runs.
 */
class ISystem {
public:
    /**
     * @brief Virtual destructor for proper cleanup of derived classes
     */
    virtual ~ISystem() = default;

    /**
     * @brief Runs the system once
     *
     * @param ctx Session state for the current frame
     */
    virtual void update(FrameContext& ctx) = 0;
};

} // namespace Systems
