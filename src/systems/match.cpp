#include "gunpong/systems/match.hpp"

#include "gunpong/components/basic.hpp"
#include "gunpong/core/debug.hpp"
#include "gunpong/core/events.hpp"
#include "gunpong/core/profile.hpp"

namespace Systems {

void MatchSystem::update(FrameContext& ctx) {
    PROFILE_SCOPE("MatchSystem");

    auto& match = ctx.match;
    if (match.phase == Components::Phase::Ongoing || match.hitstun > 0) {
        return;
    }
    if (!ctx.input.wasActionPressed(Action::Start)) {
        return;
    }

    const auto& config = ctx.config;
    float const speed = config.serveSpeed();
    float const direction = match.phase == Components::Phase::RightWin ? -1.0F : 1.0F;

    ctx.store.spawn(
        Components::Transform(Vector(config.fieldWidth / 2.0F, config.fieldHeight / 2.0F),
                              Vector(direction * speed, 0.0F)),
        Components::Ball(config.ballRadius, speed));

    for (auto [entity, bounds] : ctx.store.query<Components::Bounds>().each()) {
        (void)entity;
        bounds = Components::Bounds(config.paddleHalfWidth, config.paddleHalfHeight);
    }

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Match] " << Components::phaseName(match.phase)
                                 << " -> ONGOING, serving " << (direction > 0 ? "right" : "left") << "\n");

    match.phase = Components::Phase::Ongoing;
    ctx.events.enqueue(Events::RoundStarted{direction});
}

} // namespace Systems
