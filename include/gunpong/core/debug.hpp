#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef GUNPONG_ENABLE_DEBUG
#define GUNPONG_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (GUNPONG_ENABLE_DEBUG && (level) <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Per-frame counters of resolved interactions, printed in debug builds
class MatchDebugStats {
public:
    static void reset() {
        bullet_ball_hits = 0;
        bullet_paddle_hits = 0;
        ball_paddle_hits = 0;
        wall_bounces = 0;
        goals = 0;
    }

    static void countBulletBallHit() { bullet_ball_hits++; }
    static void countBulletPaddleHit() { bullet_paddle_hits++; }
    static void countBallPaddleHit() { ball_paddle_hits++; }
    static void countWallBounce() { wall_bounces++; }
    static void countGoal() { goals++; }

    static int totalHits() {
        return bullet_ball_hits + bullet_paddle_hits + ball_paddle_hits + wall_bounces + goals;
    }

    static void printFrameStats(unsigned long frame) {
        if (totalHits() == 0) {
            return;
        }
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
            "Frame " << frame << " collisions:\n"
            "  Bullet/ball: " << bullet_ball_hits << "\n"
            "  Bullet/paddle: " << bullet_paddle_hits << "\n"
            "  Ball/paddle: " << ball_paddle_hits << "\n"
            "  Wall bounces: " << wall_bounces << "\n"
            "  Goals: " << goals << "\n"
        );
    }

private:
    static int bullet_ball_hits;
    static int bullet_paddle_hits;
    static int ball_paddle_hits;
    static int wall_bounces;
    static int goals;
};
