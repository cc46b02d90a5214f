#include "gunpong/core/debug.hpp"

// Initialize static members
int MatchDebugStats::bullet_ball_hits = 0;
int MatchDebugStats::bullet_paddle_hits = 0;
int MatchDebugStats::ball_paddle_hits = 0;
int MatchDebugStats::wall_bounces = 0;
int MatchDebugStats::goals = 0;
