/**
 * @file frame_context.hpp
 * @brief Everything a system may touch during one update
 */

#pragma once

#include <entt/entt.hpp>

#include "gunpong/components/match.hpp"
#include "gunpong/core/entity_store.hpp"
#include "gunpong/core/game_config.hpp"
#include "gunpong/core/input.hpp"
#include "gunpong/core/random.hpp"
#include "gunpong/particles/particle_system.hpp"

namespace Systems {

/**
 * @struct FrameContext
 * @brief Non-owning bundle of the session state handed to each system.
 *
 * Built by Game for every frame; the referenced objects outlive it.
 */
struct FrameContext {
    EntityStore& store;
    Components::MatchState& match;
    Particles::ParticleSystem& particles;
    entt::dispatcher& events;
    const IInputSource& input;
    Random& random;
    const GameConfig& config;
    double now;
};

} // namespace Systems
