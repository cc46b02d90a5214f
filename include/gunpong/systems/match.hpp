/**
 * @file match.hpp
 * @brief System driving the Start/LeftWin/RightWin -> Ongoing transition
 *
 * Goals (Ongoing -> LeftWin/RightWin) are detected by the CollisionSystem;
 * this system only starts rounds.
 */

#pragma once

#include "gunpong/systems/i_system.hpp"

namespace Systems {

/**
 * @class MatchSystem
 * @brief Serves a new ball when the Start action is pressed between rounds
 */
class MatchSystem : public ISystem {
public:
    MatchSystem() = default;
    ~MatchSystem() override = default;

    /**
     * @brief Starts a round if the match is idle, unfrozen and Start was pressed
     *
     * The serve goes towards the right unless the right side won the last
     * round. Every paddle gets its full capsule back.
     */
    void update(FrameContext& ctx) override;
};

} // namespace Systems
