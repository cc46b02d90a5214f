#include <gtest/gtest.h>

#include "gunpong/components/basic.hpp"
#include "gunpong/systems/movement.hpp"
#include "test_support.hpp"

using namespace Components;

class MovementSystemTest : public ::testing::Test {
protected:
    SystemFixture fx;
    Systems::MovementSystem movement;

    void step() {
        auto ctx = fx.context();
        movement.update(ctx);
    }
};

TEST_F(MovementSystemTest, AddsVelocityOncePerSubstep) {
    Entity e = fx.store.spawn(Transform(Vector(100.0F, 200.0F), Vector(1.5F, -2.0F)), Ball());
    step();
    step();

    const auto& t = fx.store.get<Transform>(e);
    EXPECT_FLOAT_EQ(t.position.x, 103.0F);
    EXPECT_FLOAT_EQ(t.position.y, 196.0F);
    EXPECT_FLOAT_EQ(t.velocity.x, 1.5F);
}

TEST_F(MovementSystemTest, ClampsToOverscanMargin) {
    Entity right = fx.store.spawn(Transform(Vector(1290.0F, 719.0F), Vector(20.0F, 20.0F)), Bullet());
    Entity left = fx.store.spawn(Transform(Vector(-10.0F, 1.0F), Vector(-20.0F, -20.0F)), Bullet());
    step();

    const auto& r = fx.store.get<Transform>(right);
    EXPECT_FLOAT_EQ(r.position.x, 1280.0F + 16.0F);
    EXPECT_FLOAT_EQ(r.position.y, 720.0F + 16.0F);

    const auto& l = fx.store.get<Transform>(left);
    EXPECT_FLOAT_EQ(l.position.x, -16.0F);
    EXPECT_FLOAT_EQ(l.position.y, -16.0F);

    // Velocity is not touched by the clamp
    EXPECT_FLOAT_EQ(l.velocity.x, -20.0F);
}

TEST_F(MovementSystemTest, StationaryEntitiesStayPut) {
    Entity paddle = fx.store.spawn(Transform(Vector(64.0F, 360.0F)), Bounds());
    for (int i = 0; i < 10; ++i) {
        step();
    }
    EXPECT_EQ(fx.store.get<Transform>(paddle).position, Vector(64.0F, 360.0F));
}
