/**
 * @fileoverview game_manager.cpp
 * @brief Implementation of GameManager.
 */

#include "gunpong/app/game_manager.hpp"

#include <iostream>
#include <utility>

#include "gunpong/core/profile.hpp"

GameManager::GameManager(GameConfig config)
    : game(std::move(config))
    , input(game.getConfig().startKey, game.getConfig().quitKey)
    , presentation(static_cast<unsigned int>(game.getConfig().fieldWidth),
                   static_cast<unsigned int>(game.getConfig().fieldHeight))
{}

bool GameManager::init() {
    if (!presentation.init()) {
        std::cerr << "PresentationManager initialization failed." << std::endl;
        return false;
    }

    auto& dispatcher = game.getDispatcher();
    dispatcher.sink<Events::GoalScored>().connect<&GameManager::onGoalScored>(*this);
    dispatcher.sink<Events::RoundStarted>().connect<&GameManager::onRoundStarted>(*this);
    return true;
}

void GameManager::run() {
    if (!init()) {
        return;
    }

    sf::Clock sessionClock;
    sf::Clock frameClock;
    timeSinceLastProfilerPrint = sf::Time::Zero;

    while (presentation.isWindowOpen()) {
        timeSinceLastProfilerPrint += frameClock.restart();

        presentation.handleEvents(input);
        if (!presentation.isWindowOpen()) {
            break;
        }

        input.poll();
        if (input.wasActionPressed(Action::Quit)) {
            presentation.close();
            break;
        }

        double const now = static_cast<double>(sessionClock.getElapsedTime().asSeconds());
        game.tick(input, now);
        presentation.renderFrame(game, now);

        if (timeSinceLastProfilerPrint >= profilerPrintInterval) {
            Profiling::Profiler::printStats(std::cout);
            Profiling::Profiler::reset();
            timeSinceLastProfilerPrint = sf::Time::Zero;
        }
    }
}

void GameManager::onGoalScored(const Events::GoalScored& goal) {
    std::cout << "[Game] " << Components::phaseName(goal.result)
              << ", score " << goal.leftScore << " - " << goal.rightScore << std::endl;
}

void GameManager::onRoundStarted(const Events::RoundStarted& round) {
    std::cout << "[Game] round started, serving "
              << (round.serveDirection > 0.0F ? "right" : "left") << std::endl;
}
