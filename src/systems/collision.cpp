#include "gunpong/systems/collision.hpp"

#include <algorithm>
#include <cmath>

#include "gunpong/components/match.hpp"
#include "gunpong/core/debug.hpp"
#include "gunpong/core/events.hpp"
#include "gunpong/core/profile.hpp"
#include "gunpong/math/geometry.hpp"

namespace Systems {

namespace {

// Spark burst shared by both kinds of bullet impact
void emitImpact(Particles::ParticleSystem& particles, const Vector& at, const Vector& velocity) {
    particles.emit(3, at, velocity * 2.0F, 8.0F, Components::Colors::White, 0.3,
                   Vector(0.1F, 0.1F), Vector(4.0F, 8.0F), 0.5F, 0.25);
}

void emitGoalBurst(Particles::ParticleSystem& particles,
                   const Components::Transform& transform,
                   const Components::Color& color) {
    float const vx = std::fabs(transform.velocity.x);
    float const vy = std::fabs(transform.velocity.y);
    particles.emit(100, transform.position, -transform.velocity, 4.0F * (vx + vy), color, 3.0,
                   Vector(0.1F, 0.1F), Vector(2.0F + vx, 8.0F + vx), vx, 1.0);
}

// Movement parks anything leaving the field on the overscan border
bool onOverscanEdge(const Vector& p, const GameConfig& config) {
    float const m = config.overscanMargin;
    return p.x <= -m || p.y <= -m
        || p.x >= config.fieldWidth + m || p.y >= config.fieldHeight + m;
}

} // namespace

void CollisionSystem::update(FrameContext& ctx) {
    PROFILE_SCOPE("CollisionSystem");

    std::vector<BallSnapshot> balls;
    for (auto [entity, transform, ball] : ctx.store.query<Components::Transform, Components::Ball>().each()) {
        balls.push_back({entity, transform, ball});
    }

    std::vector<BulletSnapshot> bullets;
    for (auto [entity, transform, bullet] : ctx.store.query<Components::Transform, Components::Bullet>().each()) {
        bullets.push_back({entity, transform, bullet});
    }

    std::vector<PaddleSnapshot> paddles;
    for (auto [entity, transform, bounds] : ctx.store.query<Components::Transform, Components::Bounds>().each()) {
        paddles.push_back({entity, transform, bounds});
    }

    resolveBullets(ctx, bullets, balls, paddles);
    resolveBalls(ctx, paddles);
}

void CollisionSystem::resolveBullets(FrameContext& ctx,
                                     const std::vector<BulletSnapshot>& bullets,
                                     const std::vector<BallSnapshot>& balls,
                                     const std::vector<PaddleSnapshot>& paddles) {
    std::vector<Entity> spent;
    int collisions = 0;

    for (const auto& bullet : bullets) {
        const Vector& bulletPos = bullet.transform.position;

        for (const auto& ball : balls) {
            float const r = ball.ball.radius;
            if (Geometry::squaredDistance(bulletPos, ball.transform.position) >= r * r) {
                continue;
            }

            auto& transform = ctx.store.get<Components::Transform>(ball.entity);
            const auto& live = ctx.store.get<Components::Ball>(ball.entity);
            Vector const direction = (ball.transform.position - bulletPos) * ctx.config.bulletImpactScale
                                   + bullet.transform.velocity * ctx.config.deflectionInfluence;
            Geometry::redirect(transform.velocity, direction, live.speed);

            emitImpact(ctx.particles, bulletPos, transform.velocity);
            spent.push_back(bullet.entity);
            ++collisions;
            MatchDebugStats::countBulletBallHit();
            ctx.events.enqueue(Events::BulletBallHit{bulletPos});
        }

        for (const auto& paddle : paddles) {
            if (!Geometry::sphereCapsuleOverlap(bulletPos, bullet.bullet.radius,
                                                paddle.transform.position,
                                                paddle.bounds.halfWidth,
                                                paddle.bounds.halfHeight)) {
                continue;
            }

            auto& bounds = ctx.store.get<Components::Bounds>(paddle.entity);
            bounds.halfHeight = std::max(0.0F, bounds.halfHeight - ctx.config.paddleDamagePerHit);

            emitImpact(ctx.particles, bulletPos, paddle.transform.velocity);
            spent.push_back(bullet.entity);
            ++collisions;
            MatchDebugStats::countBulletPaddleHit();
            ctx.events.enqueue(Events::BulletPaddleHit{paddle.entity, bulletPos, bounds.halfHeight});
        }
    }

    // A bullet touching two bodies in one pass is marked twice
    std::sort(spent.begin(), spent.end());
    spent.erase(std::unique(spent.begin(), spent.end()), spent.end());
    for (Entity entity : spent) {
        ctx.store.despawnExpected(entity, ctx.config.strictEntityChecks);
    }
    ctx.match.hitstun += collisions;

    for (const auto& bullet : bullets) {
        const Vector& p = bullet.transform.position;
        if (onOverscanEdge(p, ctx.config)
            && !std::binary_search(spent.begin(), spent.end(), bullet.entity)) {
            ctx.store.despawnExpected(bullet.entity, ctx.config.strictEntityChecks);
        }
    }
}

void CollisionSystem::resolveBalls(FrameContext& ctx, const std::vector<PaddleSnapshot>& paddles) {
    auto& match = ctx.match;
    const auto& config = ctx.config;
    std::vector<Entity> scored;

    match.intensity = 0.0F;

    for (auto [entity, transform, ball] : ctx.store.query<Components::Transform, Components::Ball>().each()) {
        if (match.phase == Components::Phase::Ongoing
            && (transform.position.x > config.fieldWidth || transform.position.x < 0.0F)) {
            bool const leftScored = transform.position.x > config.fieldWidth;
            if (leftScored) {
                match.phase = Components::Phase::LeftWin;
                match.leftScore += 1;
            } else {
                match.phase = Components::Phase::RightWin;
                match.rightScore += 1;
            }
            emitGoalBurst(ctx.particles, transform,
                          leftScored ? Components::Colors::Red : Components::Colors::Blue);
            scored.push_back(entity);
            MatchDebugStats::countGoal();
            ctx.events.enqueue(Events::GoalScored{match.phase, match.leftScore, match.rightScore});
            continue;
        }

        if (transform.position.y < 0.0F || transform.position.y > config.fieldHeight) {
            transform.velocity.y = -transform.velocity.y;
            transform.position.y = std::clamp(transform.position.y, 0.0F, config.fieldHeight);
            MatchDebugStats::countWallBounce();
            ctx.events.enqueue(Events::WallBounce{transform.position});
        }

        for (const auto& paddle : paddles) {
            const auto& bounds = paddle.bounds;
            if (!Geometry::sphereCapsuleOverlap(transform.position, ball.radius,
                                                paddle.transform.position,
                                                bounds.halfWidth, bounds.halfHeight)) {
                continue;
            }

            ball.speed += config.ballSpeedGain / ball.speed;

            // A fully shot-down paddle has no height left to divide by
            Vector const extent(bounds.halfWidth != 0.0F ? bounds.halfWidth : 1.0F,
                                bounds.halfHeight != 0.0F ? bounds.halfHeight : 1.0F);
            Vector const direction = (transform.position - paddle.transform.position).componentDivide(extent)
                                   + paddle.transform.velocity * config.deflectionInfluence;
            Geometry::redirect(transform.velocity, direction, ball.speed);

            float const vx = std::fabs(transform.velocity.x);
            ctx.particles.emit(static_cast<int>(vx), transform.position, transform.velocity * 2.0F,
                               4.0F * vx, Components::Colors::White, 0.3,
                               Vector(0.1F, 0.1F), Vector(2.0F + vx, 4.0F + vx), 0.25F * vx, 0.25);

            match.hitstun += static_cast<int>(std::lround(ball.speed * 2.0F));
            MatchDebugStats::countBallPaddleHit();
            ctx.events.enqueue(Events::BallPaddleHit{transform.position, ball.speed});
        }

        match.intensity += ball.speed;

        ctx.particles.emit(1, transform.position, Vector(), 16.0F, Components::Colors::Trail,
                           match.intensity / 4.0F, Vector(), Vector(0.2F, 0.2F));
    }

    match.intensity *= config.intensityScale;

    for (Entity entity : scored) {
        ctx.store.despawnExpected(entity, ctx.config.strictEntityChecks);
    }
}

} // namespace Systems
