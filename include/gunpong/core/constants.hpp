#ifndef GUNPONG_CONSTANTS_HPP
#define GUNPONG_CONSTANTS_HPP

namespace GameConstants {

    // Display
    extern const unsigned int ScreenWidth;
    extern const unsigned int ScreenHeight;
    extern const unsigned int FramesPerSecond;

    // Simulation fidelity. The game is not delta-time scaled: every frame
    // runs the same number of substeps with the raw per-substep velocities.
    extern const int SubstepsPerFrame;
    extern const float OverscanMargin;

    // Field width the serve speed is normalised against
    extern const float ReferenceFieldWidth;

    // Seconds between profiler dumps in the front-end
    extern const float ProfilerPrintIntervalSeconds;

} // namespace GameConstants

#endif // GUNPONG_CONSTANTS_HPP
