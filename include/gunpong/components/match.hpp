#pragma once

#include <string>

namespace Components {

    enum class Phase {
        Start,
        Ongoing,
        LeftWin,
        RightWin
    };

    /**
     * @brief Session-wide match state, owned by Game and passed to systems.
     *
     * intensity is recomputed from scratch by every collision pass;
     * while hitstun > 0 the frame update is frozen and hitstun counts down.
     */
    struct MatchState {
        Phase phase = Phase::Start;
        int leftScore = 0;
        int rightScore = 0;
        float intensity = 0.0F;
        int hitstun = 0;
    };

    std::string phaseName(Phase phase);

} // namespace Components
