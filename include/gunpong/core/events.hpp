/**
 * @file events.hpp
 * @brief Discrete notifications raised by the simulation.
 *
 * Systems enqueue these on the Game's entt::dispatcher while a frame is being
 * updated; they are delivered once the update pass has finished, so
 * listeners (audio, logging, HUD) only ever see a consistent state.
 */

#pragma once

#include <entt/entt.hpp>

#include "gunpong/components/match.hpp"
#include "gunpong/math/vector_math.hpp"

namespace Events {

    struct BulletFired {
        entt::entity shooter;
        Vector position;
        float direction; // +1 right, -1 left
    };

    struct BulletBallHit {
        Vector position;
    };

    struct BulletPaddleHit {
        entt::entity paddle;
        Vector position;
        float remainingHalfHeight;
    };

    struct BallPaddleHit {
        Vector position;
        float speed;
    };

    struct WallBounce {
        Vector position;
    };

    struct GoalScored {
        Components::Phase result; // LeftWin or RightWin
        int leftScore;
        int rightScore;
    };

    struct RoundStarted {
        float serveDirection;
    };

} // namespace Events
