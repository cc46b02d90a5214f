/**
 * @file game_config.hpp
 * @brief Tuning parameters and bindings for a match.
 */

#pragma once

#include <cstddef>

#include "gunpong/components/control.hpp"
#include "gunpong/core/constants.hpp"
#include "gunpong/core/input.hpp"

/**
 * @enum ControllerKind
 * @brief Who drives a paddle.
 */
enum class ControllerKind {
    Player,
    AI
};

/**
 * @struct PaddleSetup
 * @brief How one paddle is controlled and which keys it listens to.
 */
struct PaddleSetup {
    ControllerKind kind = ControllerKind::Player;
    Components::Controls controls;
};

/**
 * @struct GameConfig
 * @brief Holds all gameplay parameters for a session.
 *
 * Defaults are tuned for a 1280x720 field. Velocities and
 * accelerations are per substep, not per second.
 */
struct GameConfig {
    // Field
    float fieldWidth = static_cast<float>(GameConstants::ScreenWidth);
    float fieldHeight = static_cast<float>(GameConstants::ScreenHeight);
    float overscanMargin = GameConstants::OverscanMargin;
    int substepsPerFrame = GameConstants::SubstepsPerFrame;

    // Paddles
    float paddleInset = 64.0F;
    float paddleHalfWidth = 16.0F;
    float paddleHalfHeight = 64.0F;
    float paddleDamping = 0.95F;
    float playerAcceleration = 0.3F;
    float aiResponse = 60.0F;
    float aiAccelerationLimit = 0.25F;

    // Bullets
    double fireCooldown = 0.35;
    float bulletSpawnOffset = 32.0F;
    float bulletSpeed = 2.0F;
    float bulletSpread = 0.1F;
    float bulletRadius = 2.0F;
    float bulletImpactScale = 0.5F;   // weight of the centre offset when a bullet knocks the ball
    float paddleDamagePerHit = 1.0F;

    // Ball
    float ballRadius = 16.0F;
    float ballSpeedGain = 0.5F;       // speed += gain / speed on every paddle hit
    float deflectionInfluence = 0.25F; // share of the hitter's velocity passed on

    // Feedback
    float intensityScale = 4.0F;

    // Particles
    std::size_t maxParticles = 20000;
    unsigned int ambientEmitInterval = 8; // frames between falling stars
    int openingStarCount = 125;

    // 0 seeds from the clock
    unsigned int randomSeed = 0;

    // Removing an entity that is already gone throws instead of warning
#ifdef NDEBUG
    bool strictEntityChecks = false;
#else
    bool strictEntityChecks = true;
#endif

    PaddleSetup leftPaddle{ControllerKind::Player, {{Key::W}, {Key::A}, {Key::S}, {Key::D}}};
    PaddleSetup rightPaddle{ControllerKind::AI, {{Key::Up}, {Key::Left}, {Key::Down}, {Key::Right}}};

    Key startKey = Key::Space;
    Key quitKey = Key::Escape;

    /** @brief Serve speed, scaled so that wider fields play at the same pace. */
    float serveSpeed() const;

    /** @brief Copy of this config resized to a new field. */
    GameConfig withField(float width, float height) const;
};
