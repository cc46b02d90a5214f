#include "gunpong/systems/control.hpp"

#include <algorithm>
#include <cmath>

#include "gunpong/core/debug.hpp"
#include "gunpong/core/events.hpp"
#include "gunpong/core/profile.hpp"
#include "gunpong/math/geometry.hpp"

namespace Systems {

float ControlSystem::aiAcceleration(const Vector& paddle,
                                    const std::vector<Vector>& balls,
                                    const GameConfig& config) {
    if (balls.empty()) {
        return 0.0F;
    }

    Vector target = balls.front();
    float best = Geometry::squaredDistance(paddle, target);
    for (const auto& ball : balls) {
        float const d = Geometry::squaredDistance(paddle, ball);
        if (d < best) {
            best = d;
            target = ball;
        }
    }

    float const sign = static_cast<float>((paddle.y < target.y) - (paddle.y > target.y));
    float const accel = sign * config.aiResponse * std::sqrt(best) / config.fieldWidth;
    return std::clamp(accel, -config.aiAccelerationLimit, config.aiAccelerationLimit);
}

void ControlSystem::applyPlayer(FrameContext& ctx,
                                Entity entity,
                                Components::Transform& transform,
                                Components::PlayerControl& control,
                                std::vector<PendingBullet>& bullets) {
    const auto& keys = control.controls;
    bool const up = isAnyKeyDown(ctx.input, keys.up);
    bool const down = isAnyKeyDown(ctx.input, keys.down);
    bool const left = isAnyKeyDown(ctx.input, keys.left);
    bool const right = isAnyKeyDown(ctx.input, keys.right);

    transform.velocity.y += static_cast<float>(static_cast<int>(down) - static_cast<int>(up))
                            * ctx.config.playerAcceleration;

    if (left == right || ctx.now <= control.nextFireTime) {
        return;
    }
    control.nextFireTime = ctx.now + ctx.config.fireCooldown;

    float const direction = right ? 1.0F : -1.0F;
    Components::Transform bullet(
        transform.position + Vector(direction * ctx.config.bulletSpawnOffset, 0.0F),
        Vector(direction * ctx.config.bulletSpeed, ctx.random.jitter(ctx.config.bulletSpread)));
    bullets.push_back({entity, bullet, direction});
}

void ControlSystem::update(FrameContext& ctx) {
    PROFILE_SCOPE("ControlSystem");

    std::vector<Vector> balls;
    for (auto [entity, transform, ball] : ctx.store.query<Components::Transform, Components::Ball>().each()) {
        (void)entity;
        (void)ball;
        balls.push_back(transform.position);
    }

    std::vector<PendingBullet> bullets;

    auto view = ctx.store.query<Components::Transform, Components::ControlType>();
    for (auto [entity, transform, control] : view.each()) {
        transform.velocity *= ctx.config.paddleDamping;

        if (auto* player = std::get_if<Components::PlayerControl>(&control)) {
            applyPlayer(ctx, entity, transform, *player, bullets);
        } else if (std::get_if<Components::AIControl>(&control) != nullptr) {
            transform.velocity.y += aiAcceleration(transform.position, balls, ctx.config);
        }

        ctx.particles.emit(1, transform.position, Vector(), 16.0F, Components::Colors::Trail,
                           0.5, Vector(), Vector(0.2F, 0.2F));
    }

    for (const auto& pending : bullets) {
        ctx.store.spawn(Components::Transform(pending.transform),
                        Components::Bullet(ctx.config.bulletRadius));
        ctx.events.enqueue(Events::BulletFired{pending.shooter, pending.transform.position, pending.direction});
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Control] bullet fired at x=" << pending.transform.position.x << "\n");
    }
}

} // namespace Systems
