#include <gtest/gtest.h>

#include <cmath>

#include "gunpong/components/basic.hpp"
#include "gunpong/particles/particle_system.hpp"

using Particles::Particle;
using Particles::ParticleSystem;

TEST(ParticleSystemTest, EmitWithoutJitterCopiesBaseValues) {
    ParticleSystem particles(100, 3);
    particles.setClock(10.0);
    particles.emit(4, Vector(5.0F, 6.0F), Vector(1.0F, -1.0F), 8.0F, Components::Colors::Red, 2.0);

    ASSERT_EQ(particles.size(), 4u);
    for (const auto& p : particles.getParticles()) {
        EXPECT_EQ(p.position, Vector(5.0F, 6.0F));
        EXPECT_EQ(p.velocity, Vector(1.0F, -1.0F));
        EXPECT_FLOAT_EQ(p.size, 8.0F);
        EXPECT_EQ(p.color, Components::Colors::Red);
        EXPECT_DOUBLE_EQ(p.birthtime, 10.0);
        EXPECT_DOUBLE_EQ(p.deathtime, 12.0);
    }
}

TEST(ParticleSystemTest, JitterStaysWithinRange) {
    ParticleSystem particles(1000, 11);
    particles.emit(200, Vector(100.0F, 100.0F), Vector(0.0F, 0.0F), 4.0F, Components::Colors::White, 1.0,
                   Vector(3.0F, 0.0F), Vector(0.5F, 2.0F), 1.0F, 0.25);

    for (const auto& p : particles.getParticles()) {
        EXPECT_GE(p.position.x, 97.0F);
        EXPECT_LE(p.position.x, 103.0F);
        EXPECT_FLOAT_EQ(p.position.y, 100.0F);
        EXPECT_LE(std::abs(p.velocity.x), 0.5F);
        EXPECT_LE(std::abs(p.velocity.y), 2.0F);
        EXPECT_GE(p.size, 3.0F);
        EXPECT_LE(p.size, 5.0F);
        EXPECT_GE(p.deathtime, 0.75);
        EXPECT_LE(p.deathtime, 1.25);
    }
}

TEST(ParticleSystemTest, AdvanceIntegratesThenPrunes) {
    ParticleSystem particles(100, 5);
    particles.emit(1, Vector(0.0F, 0.0F), Vector(2.0F, 0.5F), 4.0F, Components::Colors::White, 1.0);

    particles.advance(0.5);
    ASSERT_EQ(particles.size(), 1u);
    EXPECT_EQ(particles.getParticles().front().position, Vector(2.0F, 0.5F));

    particles.advance(0.9);
    EXPECT_EQ(particles.getParticles().front().position, Vector(4.0F, 1.0F));

    // Dead exactly at its death time
    particles.advance(1.0);
    EXPECT_EQ(particles.size(), 0u);
}

TEST(ParticleSystemTest, AgeSpreadKillsParticlesAtDifferentTimes) {
    ParticleSystem particles(1000, 9);
    particles.emit(200, Vector(), Vector(), 2.0F, Components::Colors::White, 3.0,
                   Vector(), Vector(), 0.0F, 1.0);

    particles.advance(2.0);
    EXPECT_EQ(particles.size(), 200u);

    particles.advance(3.0);
    EXPECT_GT(particles.size(), 0u);
    EXPECT_LT(particles.size(), 200u);

    particles.advance(4.0);
    EXPECT_EQ(particles.size(), 0u);
}

TEST(ParticleSystemTest, LifeFractionShrinksOverLifetime) {
    Particle p;
    p.birthtime = 1.0;
    p.deathtime = 3.0;

    EXPECT_FLOAT_EQ(p.lifeFraction(1.0), 1.0F);
    EXPECT_FLOAT_EQ(p.lifeFraction(2.0), 0.5F);
    EXPECT_FLOAT_EQ(p.lifeFraction(3.0), 0.0F);
    EXPECT_FLOAT_EQ(p.lifeFraction(0.0), 1.0F);
    EXPECT_FLOAT_EQ(p.lifeFraction(10.0), 0.0F);

    // Born already dead (negative age jitter)
    p.deathtime = 0.5;
    EXPECT_FLOAT_EQ(p.lifeFraction(1.0), 0.0F);
}

TEST(ParticleSystemTest, CapEvictsOldestFirst) {
    ParticleSystem particles(3, 1);
    for (int i = 0; i < 5; ++i) {
        particles.emit(1, Vector(static_cast<float>(i), 0.0F), Vector(), 1.0F, Components::Colors::White, 10.0);
    }

    ASSERT_EQ(particles.size(), 3u);
    EXPECT_EQ(particles.capacity(), 3u);
    EXPECT_FLOAT_EQ(particles.getParticles().front().position.x, 2.0F);
    EXPECT_FLOAT_EQ(particles.getParticles().back().position.x, 4.0F);
}

TEST(ParticleSystemTest, ClearEmptiesContainer) {
    ParticleSystem particles(100, 1);
    particles.emit(10, Vector(), Vector(), 1.0F, Components::Colors::White, 10.0);
    particles.clear();
    EXPECT_EQ(particles.size(), 0u);
}
