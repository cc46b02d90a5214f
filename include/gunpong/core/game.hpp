/**
 * @file game.hpp
 * @brief Session owner: entities, match state, particles and the frame update
 */

#pragma once

#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "gunpong/components/match.hpp"
#include "gunpong/core/entity_store.hpp"
#include "gunpong/core/game_config.hpp"
#include "gunpong/core/input.hpp"
#include "gunpong/core/random.hpp"
#include "gunpong/particles/particle_system.hpp"
#include "gunpong/systems/i_system.hpp"

/**
 * @class Game
 * @brief Maintains one match and performs the per-frame update.
 *
 * A frame runs, in order: particle integration, then (unless the match is
 * frozen by hitstun) the match system followed by a fixed number of
 * control/movement/collision substeps, then ambient star emission. Events
 * raised during the frame are delivered to dispatcher listeners at its end.
 */
class Game {
public:
    explicit Game(GameConfig config = GameConfig());
    ~Game();

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    /**
     * @brief Clears every entity and particle and sets up a fresh match
     *
     * Spawns both paddles with full capsules and the opening starfield.
     */
    void reset();

    /**
     * @brief Advances the session by one frame
     * @param input Input state for this frame
     * @param now Wall clock in seconds, used for cooldowns and particle lifetimes
     */
    void tick(const IInputSource& input, double now);

    EntityStore& getStore() { return store; }
    const EntityStore& getStore() const { return store; }

    const Components::MatchState& getMatchState() const { return match; }
    Components::MatchState& getMatchState() { return match; }

    const Particles::ParticleSystem& getParticles() const { return particles; }

    /**
     * @brief Dispatcher carrying the notifications in events.hpp
     *
     * Connect listeners with getDispatcher().sink<Events::GoalScored>().connect<...>().
     */
    entt::dispatcher& getDispatcher() { return dispatcher; }

    const GameConfig& getConfig() const { return config; }
    unsigned long getFrameCount() const { return frameCount; }

    /** @brief The left and right paddle entities created by the last reset. */
    Entity getLeftPaddle() const { return leftPaddle; }
    Entity getRightPaddle() const { return rightPaddle; }

private:
    GameConfig config;
    EntityStore store;
    Components::MatchState match;
    // Declared before particles, which draws its seed from it
    Random random;
    Particles::ParticleSystem particles;
    entt::dispatcher dispatcher;

    std::unique_ptr<Systems::ISystem> matchSystem;
    std::vector<std::unique_ptr<Systems::ISystem>> substepSystems;

    unsigned long frameCount = 0;
    Entity leftPaddle = entt::null;
    Entity rightPaddle = entt::null;

    /**
     * @brief Create all system instances in update order
     */
    void createSystems();

    Entity spawnPaddle(float x, const PaddleSetup& setup);

    void emitStars(int count, const Vector& position, const Vector& spread);
};
