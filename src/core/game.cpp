/**
 * @fileoverview game.cpp
 * @brief Implementation of Game.
 */

#include "gunpong/core/game.hpp"

#include <iostream>
#include <utility>

#include "gunpong/components/basic.hpp"
#include "gunpong/components/control.hpp"
#include "gunpong/core/debug.hpp"
#include "gunpong/core/profile.hpp"
#include "gunpong/systems/collision.hpp"
#include "gunpong/systems/control.hpp"
#include "gunpong/systems/match.hpp"
#include "gunpong/systems/movement.hpp"

namespace {

Components::ControlType makeControl(const PaddleSetup& setup) {
    if (setup.kind == ControllerKind::AI) {
        return Components::AIControl{};
    }
    return Components::PlayerControl(setup.controls);
}

// The particle source gets its own stream so that visual noise never
// shifts the gameplay sequence for a fixed seed. A wall-clock game seed is
// shared by every source built in the same second, so draw one instead.
unsigned int particleSeed(unsigned int seed, Random& random) {
    return seed == 0 ? random.nextSeed() : seed + 1;
}

} // namespace

Game::Game(GameConfig cfg)
    : config(std::move(cfg))
    , random(config.randomSeed)
    , particles(config.maxParticles, particleSeed(config.randomSeed, random))
{
    createSystems();
    reset();
}

Game::~Game() = default;

void Game::createSystems() {
    substepSystems.clear();

    matchSystem = std::make_unique<Systems::MatchSystem>();
    substepSystems.push_back(std::make_unique<Systems::ControlSystem>());
    substepSystems.push_back(std::make_unique<Systems::MovementSystem>());
    substepSystems.push_back(std::make_unique<Systems::CollisionSystem>());
}

Entity Game::spawnPaddle(float x, const PaddleSetup& setup) {
    return store.spawn(
        Components::Transform(Vector(x, config.fieldHeight / 2.0F)),
        Components::Bounds(config.paddleHalfWidth, config.paddleHalfHeight),
        makeControl(setup));
}

void Game::emitStars(int count, const Vector& position, const Vector& spread) {
    particles.emit(count, position, Vector(0.0F, 0.4F), 2.0F, Components::Colors::White, 60.0,
                   spread, Vector(0.0F, 0.2F));
}

void Game::reset() {
    store.clear();
    match = Components::MatchState();
    particles.clear();
    dispatcher.clear();

    leftPaddle = spawnPaddle(config.paddleInset, config.leftPaddle);
    rightPaddle = spawnPaddle(config.fieldWidth - config.paddleInset, config.rightPaddle);

    Vector const centre(config.fieldWidth / 2.0F, config.fieldHeight / 2.0F);
    emitStars(config.openingStarCount, centre, centre);

    std::cout << "[Game] reset: " << store.size() << " entities, "
              << particles.size() << " particles" << std::endl;
}

void Game::tick(const IInputSource& input, double now) {
    PROFILE_SCOPE("Game::tick");

    ++frameCount;
    MatchDebugStats::reset();

    particles.advance(now);

    Systems::FrameContext ctx{store, match, particles, dispatcher, input, random, config, now};

    if (match.hitstun <= 0) {
        matchSystem->update(ctx);
        for (int step = 0; step < config.substepsPerFrame; ++step) {
            for (auto& system : substepSystems) {
                system->update(ctx);
            }
        }
    } else {
        match.hitstun -= 1;
    }

    if (config.ambientEmitInterval > 0 && frameCount % config.ambientEmitInterval == 0) {
        emitStars(1, Vector(config.fieldWidth / 2.0F, -4.0F), Vector(config.fieldWidth / 2.0F, 0.0F));
    }

    MatchDebugStats::printFrameStats(frameCount);

    dispatcher.update();
}
