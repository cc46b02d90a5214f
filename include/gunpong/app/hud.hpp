/**
 * @file hud.hpp
 * @brief Values the front-end derives from the match state each frame
 *
 * Kept free of any windowing types so the derivations can be checked
 * without opening a window.
 */

#pragma once

#include <string>

#include "gunpong/components/match.hpp"
#include "gunpong/math/vector_math.hpp"

namespace Hud {

/**
 * @struct Backdrop
 * @brief Background colour with channels in [0, 1] (values above 1 saturate)
 */
struct Backdrop {
    float r = 0.0F;
    float g = 0.0F;
    float b = 0.0F;
};

/**
 * @brief Colour the background drifts towards
 *
 * Brightens with intensity and hitstun; each side's score tints its channel
 * (left red, right blue).
 */
Backdrop targetBackdrop(const Components::MatchState& match);

/**
 * @brief Moves current 10% of the way to target
 */
Backdrop ease(const Backdrop& current, const Backdrop& target);

/**
 * @brief Screen shake for the given frame; zero when there is no hitstun
 */
Vector shakeOffset(unsigned long frame, int hitstun);

/** @brief Headline shown at the top of the field. */
std::string phaseText(Components::Phase phase);

/** @brief "left - right" */
std::string scoreText(const Components::MatchState& match);

/** @brief Intensity rounded to a whole number. */
std::string intensityText(const Components::MatchState& match);

} // namespace Hud
