#include "gunpong/app/hud.hpp"

#include <algorithm>
#include <cmath>

namespace Hud {

Backdrop targetBackdrop(const Components::MatchState& match) {
    float const base = match.intensity / 400.0F
                     + std::clamp(static_cast<float>(match.hitstun) / 10.0F, 0.0F, 0.1F);
    Backdrop target;
    target.r = base + static_cast<float>(match.leftScore) / 50.0F;
    target.g = base;
    target.b = base + static_cast<float>(match.rightScore) / 50.0F;
    return target;
}

Backdrop ease(const Backdrop& current, const Backdrop& target) {
    Backdrop next;
    next.r = current.r * 0.9F + target.r * 0.1F;
    next.g = current.g * 0.9F + target.g * 0.1F;
    next.b = current.b * 0.9F + target.b * 0.1F;
    return next;
}

Vector shakeOffset(unsigned long frame, int hitstun) {
    float const f = static_cast<float>(frame);
    float const amount = static_cast<float>(hitstun) / 2.0F;
    return {std::sin(f) * amount, std::sin(f * 0.1F) * amount};
}

std::string phaseText(Components::Phase phase) {
    switch (phase) {
        case Components::Phase::Start:    return "Waiting for start.";
        case Components::Phase::Ongoing:  return "Game ahoy!";
        case Components::Phase::LeftWin:  return "Left wins!";
        case Components::Phase::RightWin: return "Right wins!";
        default: return "";
    }
}

std::string scoreText(const Components::MatchState& match) {
    return std::to_string(match.leftScore) + " - " + std::to_string(match.rightScore);
}

std::string intensityText(const Components::MatchState& match) {
    return std::to_string(static_cast<long>(std::fabs(std::round(match.intensity))));
}

} // namespace Hud
