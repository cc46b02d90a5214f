/**
 * @fileoverview main.cpp
 * @brief Main entry point for the game.
 *
 * Runs a session with the default configuration (left paddle on WASD,
 * right paddle AI). Pass "--two-players" to put the right paddle on the
 * arrow keys instead.
 */

#include <iostream>
#include <string>

#include "gunpong/app/game_manager.hpp"

int main(int argc, char* argv[]) {
    GameConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string const arg = argv[i];
        if (arg == "--two-players") {
            config.rightPaddle.kind = ControllerKind::Player;
        } else {
            std::cerr << "Unknown option " << arg << std::endl;
            return 1;
        }
    }

    GameManager manager(config);
    manager.run();

    return 0;
}
