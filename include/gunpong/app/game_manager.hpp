/**
 * @fileoverview game_manager.hpp
 * @brief High-level controller owning the main loop.
 */

#pragma once

#include <SFML/System/Clock.hpp>
#include <SFML/System/Time.hpp>

#include "gunpong/app/keyboard_input.hpp"
#include "gunpong/app/presentation_manager.hpp"
#include "gunpong/core/events.hpp"
#include "gunpong/core/game.hpp"
#include "gunpong/core/game_config.hpp"

/**
 * @class GameManager
 * @brief Runs one session: polls input, ticks the Game, renders.
 */
class GameManager {
public:
    explicit GameManager(GameConfig config = GameConfig());

    GameManager(const GameManager&) = delete;
    GameManager& operator=(const GameManager&) = delete;

    /** @brief Runs until the window closes or the quit key is pressed. */
    void run();

    /**
     * @brief Opens the window and hooks event listeners.
     * @return true on success, false otherwise.
     */
    bool init();

private:
    Game game;
    KeyboardInput input;
    PresentationManager presentation;

    // Timer for profiler printing
    sf::Time timeSinceLastProfilerPrint;
    const sf::Time profilerPrintInterval = sf::seconds(GameConstants::ProfilerPrintIntervalSeconds);

    void onGoalScored(const Events::GoalScored& goal);
    void onRoundStarted(const Events::RoundStarted& round);
};
