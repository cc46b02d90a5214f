#include "gunpong/systems/movement.hpp"

#include <algorithm>

#include "gunpong/components/basic.hpp"
#include "gunpong/core/profile.hpp"

namespace Systems {

void MovementSystem::update(FrameContext& ctx) {
    PROFILE_SCOPE("MovementSystem");

    float const margin = ctx.config.overscanMargin;
    float const maxX = ctx.config.fieldWidth + margin;
    float const maxY = ctx.config.fieldHeight + margin;

    for (auto [entity, transform] : ctx.store.query<Components::Transform>().each()) {
        (void)entity;
        transform.position += transform.velocity;

        // Keep everything just outside the visible field so goals and the
        // edge cleanup can still see it
        transform.position.x = std::clamp(transform.position.x, -margin, maxX);
        transform.position.y = std::clamp(transform.position.y, -margin, maxY);
    }
}

} // namespace Systems
