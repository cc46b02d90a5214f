/**
 * @file particle_system.hpp
 * @brief Short-lived visual particles (sparks, trails, stars)
 *
 * Particles are not entities: they never collide and nothing reads them
 * except the renderer, so they live in a flat container owned by the Game.
 * Each particle moves by its velocity once per frame and is removed when its
 * death time has passed.
 */

#pragma once

#include <cstddef>
#include <deque>

#include "gunpong/components/basic.hpp"
#include "gunpong/core/random.hpp"
#include "gunpong/math/vector_math.hpp"

namespace Particles {

struct Particle {
    Vector position;
    Vector velocity;
    float size = 0.0F;
    Components::Color color;
    double birthtime = 0.0;
    double deathtime = 0.0;

    /**
     * @brief Remaining share of the particle's life at time now, in [0, 1]
     */
    float lifeFraction(double now) const;
};

/**
 * @class ParticleSystem
 * @brief Emits, integrates and prunes particles
 *
 * The container is capped; when full, the oldest particle is dropped to make
 * room for a new one.
 */
class ParticleSystem {
public:
    explicit ParticleSystem(std::size_t maxParticles = 20000, unsigned int seed = 0);

    /**
     * @brief Spawns count particles around a base state
     *
     * Every value gets independent symmetric jitter: each position and velocity
     * axis by the matching jitter component, the size by sizeJitter and the
     * lifetime (seconds) by ageJitter. Birth time is the current clock.
     */
    void emit(int count,
              const Vector& position,
              const Vector& velocity,
              float size,
              const Components::Color& color,
              double age,
              const Vector& positionJitter = {},
              const Vector& velocityJitter = {},
              float sizeJitter = 0.0F,
              double ageJitter = 0.0);

    /**
     * @brief Moves every particle by its velocity, then drops the dead ones
     * @param now Current clock in seconds; also becomes the emit clock
     */
    void advance(double now);

    /** @brief Sets the clock used for birth and death times without integrating. */
    void setClock(double now) { clock = now; }

    void clear();

    const std::deque<Particle>& getParticles() const { return particles; }
    std::size_t size() const { return particles.size(); }
    std::size_t capacity() const { return maxParticles; }

private:
    std::deque<Particle> particles;
    std::size_t maxParticles;
    double clock = 0.0;
    Random random;
};

} // namespace Particles
