#include "gunpong/particles/particle_system.hpp"

#include <algorithm>

#include "gunpong/core/profile.hpp"

namespace Particles {

float Particle::lifeFraction(double now) const {
    double const span = deathtime - birthtime;
    if (span <= 0.0) {
        return 0.0F;
    }
    double const remaining = (deathtime - now) / span;
    return static_cast<float>(std::clamp(remaining, 0.0, 1.0));
}

ParticleSystem::ParticleSystem(std::size_t maxParticles, unsigned int seed)
    : maxParticles(maxParticles)
    , random(seed)
{}

void ParticleSystem::emit(int count,
                          const Vector& position,
                          const Vector& velocity,
                          float size,
                          const Components::Color& color,
                          double age,
                          const Vector& positionJitter,
                          const Vector& velocityJitter,
                          float sizeJitter,
                          double ageJitter) {
    if (maxParticles == 0) {
        return;
    }
    for (int i = 0; i < count; ++i) {
        if (particles.size() >= maxParticles) {
            particles.pop_front();
        }

        Particle p;
        p.position = Vector(position.x + random.jitter(positionJitter.x),
                            position.y + random.jitter(positionJitter.y));
        p.velocity = Vector(velocity.x + random.jitter(velocityJitter.x),
                            velocity.y + random.jitter(velocityJitter.y));
        p.size = size + random.jitter(sizeJitter);
        p.color = color;
        p.birthtime = clock;
        p.deathtime = clock + age + random.jitter(ageJitter);
        particles.push_back(p);
    }
}

void ParticleSystem::advance(double now) {
    PROFILE_SCOPE("ParticleSystem::advance");
    clock = now;

    for (auto& p : particles) {
        p.position += p.velocity;
    }

    particles.erase(
        std::remove_if(particles.begin(), particles.end(),
                       [now](const Particle& p) { return p.deathtime <= now; }),
        particles.end());
}

void ParticleSystem::clear() {
    particles.clear();
}

} // namespace Particles
