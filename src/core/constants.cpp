#include "gunpong/core/constants.hpp"

namespace GameConstants {

    const unsigned int ScreenWidth     = 1280;
    const unsigned int ScreenHeight    = 720;
    const unsigned int FramesPerSecond = 60;

    const int SubstepsPerFrame  = 3;
    const float OverscanMargin  = 16.0F;

    const float ReferenceFieldWidth = 1280.0F;

    const float ProfilerPrintIntervalSeconds = 10.0F;

} // namespace GameConstants
