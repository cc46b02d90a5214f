#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "gunpong/components/basic.hpp"
#include "gunpong/components/control.hpp"
#include "gunpong/core/events.hpp"
#include "gunpong/systems/control.hpp"
#include "test_support.hpp"

using namespace Components;

namespace {

Controls wasd() {
    return Controls{{Key::W}, {Key::A}, {Key::S}, {Key::D}};
}

struct FiredLog {
    std::vector<Events::BulletFired> fired;
    void onFired(const Events::BulletFired& e) { fired.push_back(e); }
};

} // namespace

class ControlSystemTest : public ::testing::Test {
protected:
    SystemFixture fx;
    Systems::ControlSystem control;

    Entity spawnPlayer(Vector position = Vector(64.0F, 360.0F), Vector velocity = Vector()) {
        return fx.store.spawn(Transform(position, velocity), Bounds(),
                              ControlType(PlayerControl(wasd())));
    }

    Entity spawnAI(Vector position = Vector(1216.0F, 360.0F), Vector velocity = Vector()) {
        return fx.store.spawn(Transform(position, velocity), Bounds(), ControlType(AIControl{}));
    }

    void step(double now = 1.0) {
        auto ctx = fx.context(now);
        control.update(ctx);
    }
};

TEST_F(ControlSystemTest, DampsVelocity) {
    Entity p = spawnPlayer(Vector(64.0F, 360.0F), Vector(0.0F, 2.0F));
    step();
    EXPECT_FLOAT_EQ(fx.store.get<Transform>(p).velocity.y, 2.0F * 0.95F);
}

TEST_F(ControlSystemTest, PlayerAcceleratesVertically) {
    Entity p = spawnPlayer();
    fx.input.press(Key::S);
    step();
    EXPECT_FLOAT_EQ(fx.store.get<Transform>(p).velocity.y, 0.3F);

    fx.input.release(Key::S);
    fx.input.press(Key::W);
    step();
    EXPECT_FLOAT_EQ(fx.store.get<Transform>(p).velocity.y, 0.3F * 0.95F - 0.3F);

    // Opposite keys cancel out
    fx.input.press(Key::S);
    step();
    EXPECT_FLOAT_EQ(fx.store.get<Transform>(p).velocity.y, (0.3F * 0.95F - 0.3F) * 0.95F);
}

TEST_F(ControlSystemTest, AnyBoundKeyCounts) {
    Controls controls = wasd();
    controls.down.push_back(Key::K);
    Entity p = fx.store.spawn(Transform(Vector(64.0F, 360.0F)), Bounds(),
                              ControlType(PlayerControl(controls)));
    fx.input.press(Key::K);
    step();
    EXPECT_FLOAT_EQ(fx.store.get<Transform>(p).velocity.y, 0.3F);
}

TEST_F(ControlSystemTest, FiringSpawnsBulletAndStartsCooldown) {
    FiredLog log;
    fx.events.sink<Events::BulletFired>().connect<&FiredLog::onFired>(log);

    Entity p = spawnPlayer();
    fx.input.press(Key::D);
    step(1.0);

    ASSERT_EQ((fx.store.count<Transform, Bullet>()), 1u);
    for (auto [entity, transform, bullet] : fx.store.query<Transform, Bullet>().each()) {
        (void)entity;
        EXPECT_FLOAT_EQ(transform.position.x, 64.0F + 32.0F);
        EXPECT_FLOAT_EQ(transform.position.y, 360.0F);
        EXPECT_FLOAT_EQ(transform.velocity.x, 2.0F);
        EXPECT_LE(std::fabs(transform.velocity.y), 0.1F);
        EXPECT_FLOAT_EQ(bullet.radius, 2.0F);
    }

    const auto& pc = std::get<PlayerControl>(fx.store.get<ControlType>(p));
    EXPECT_NEAR(pc.nextFireTime, 1.35, 1e-9);

    // Still cooling down
    step(1.2);
    step(1.3);
    EXPECT_EQ((fx.store.count<Transform, Bullet>()), 1u);

    step(1.36);
    EXPECT_EQ((fx.store.count<Transform, Bullet>()), 2u);

    fx.events.update();
    ASSERT_EQ(log.fired.size(), 2u);
    EXPECT_EQ(log.fired.front().shooter, p);
    EXPECT_FLOAT_EQ(log.fired.front().direction, 1.0F);
}

TEST_F(ControlSystemTest, FiresLeftWithLeftKey) {
    spawnPlayer(Vector(1216.0F, 360.0F));
    fx.input.press(Key::A);
    step();

    for (auto [entity, transform, bullet] : fx.store.query<Transform, Bullet>().each()) {
        (void)entity;
        (void)bullet;
        EXPECT_FLOAT_EQ(transform.position.x, 1216.0F - 32.0F);
        EXPECT_FLOAT_EQ(transform.velocity.x, -2.0F);
    }
    EXPECT_EQ((fx.store.count<Transform, Bullet>()), 1u);
}

TEST_F(ControlSystemTest, BothFireKeysDoNothing) {
    Entity p = spawnPlayer();
    fx.input.press(Key::A);
    fx.input.press(Key::D);
    step();
    EXPECT_EQ((fx.store.count<Transform, Bullet>()), 0u);
    EXPECT_DOUBLE_EQ(std::get<PlayerControl>(fx.store.get<ControlType>(p)).nextFireTime, 0.0);
}

TEST_F(ControlSystemTest, AIWithoutBallsOnlyDamps) {
    Entity ai = spawnAI(Vector(1216.0F, 360.0F), Vector(0.0F, 1.0F));
    step();
    EXPECT_FLOAT_EQ(fx.store.get<Transform>(ai).velocity.y, 0.95F);
}

TEST_F(ControlSystemTest, AIAccelerationIsClamped) {
    GameConfig config;
    // Far away: 60 * 1000 / 1280 is well past the limit
    EXPECT_FLOAT_EQ(Systems::ControlSystem::aiAcceleration(Vector(0.0F, 0.0F), {Vector(0.0F, 1000.0F)}, config), 0.25F);
    EXPECT_FLOAT_EQ(Systems::ControlSystem::aiAcceleration(Vector(0.0F, 1000.0F), {Vector(0.0F, 0.0F)}, config), -0.25F);

    // Close: 60 * 4 / 1280
    EXPECT_FLOAT_EQ(Systems::ControlSystem::aiAcceleration(Vector(0.0F, 0.0F), {Vector(0.0F, 4.0F)}, config),
                    60.0F * 4.0F / 1280.0F);

    // Level with the ball: no vertical push
    EXPECT_FLOAT_EQ(Systems::ControlSystem::aiAcceleration(Vector(0.0F, 5.0F), {Vector(300.0F, 5.0F)}, config), 0.0F);
}

TEST_F(ControlSystemTest, AITracksNearestBallFirstWinsTies) {
    GameConfig config;
    Vector const paddle(100.0F, 100.0F);

    // Nearest is below
    std::vector<Vector> balls{Vector(100.0F, -200.0F), Vector(100.0F, 104.0F)};
    EXPECT_GT(Systems::ControlSystem::aiAcceleration(paddle, balls, config), 0.0F);

    // Equal distance, opposite sides: the first listed wins
    std::vector<Vector> tie{Vector(100.0F, 96.0F), Vector(100.0F, 104.0F)};
    EXPECT_LT(Systems::ControlSystem::aiAcceleration(paddle, tie, config), 0.0F);
    std::vector<Vector> tieSwapped{Vector(100.0F, 104.0F), Vector(100.0F, 96.0F)};
    EXPECT_GT(Systems::ControlSystem::aiAcceleration(paddle, tieSwapped, config), 0.0F);
}

TEST_F(ControlSystemTest, AIMovesTowardsLiveBall) {
    Entity ai = spawnAI(Vector(1216.0F, 360.0F));
    fx.store.spawn(Transform(Vector(640.0F, 100.0F)), Ball());
    step();
    EXPECT_FLOAT_EQ(fx.store.get<Transform>(ai).velocity.y, -0.25F);
}

TEST_F(ControlSystemTest, EachPaddleLeavesATrail) {
    spawnPlayer();
    spawnAI();
    std::size_t const before = fx.particles.size();
    step();
    EXPECT_EQ(fx.particles.size(), before + 2);
}
