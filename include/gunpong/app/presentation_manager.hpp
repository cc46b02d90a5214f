/**
 * @fileoverview presentation_manager.hpp
 * @brief Manages the application window, event polling, and drawing.
 *
 * Reads the Game's entities, particles and match state; never writes them.
 */

#pragma once

#include <string>

#include <SFML/Graphics.hpp>
#include <SFML/Window/Event.hpp>

#include "gunpong/app/hud.hpp"
#include "gunpong/core/game.hpp"

class KeyboardInput;

/**
 * @class PresentationManager
 * @brief Owns the SFML window and draws one frame of the game.
 */
class PresentationManager {
public:
    PresentationManager(unsigned int screenWidth, unsigned int screenHeight);
    ~PresentationManager() = default;

    PresentationManager(const PresentationManager&) = delete;
    PresentationManager& operator=(const PresentationManager&) = delete;

    /**
     * @brief Opens the window and loads the HUD font.
     * @return false if the window could not be created. A missing font only
     *         disables text.
     */
    bool init();

    /** @brief Drains window events; closes on request and drops held keys on focus loss. */
    void handleEvents(KeyboardInput& input);

    /** @brief Draws particles, bodies, HUD and tutorial labels, then presents. */
    void renderFrame(const Game& game, double now);

    bool isWindowOpen() const { return window.isOpen(); }
    void close() { window.close(); }

private:
    unsigned int screenWidth;
    unsigned int screenHeight;

    sf::RenderWindow window;
    sf::Font font;
    bool fontLoaded = false;

    Hud::Backdrop backdrop;

    void drawParticles(const Game& game, double now, const sf::Transform& transform);
    void drawBodies(const Game& game, const sf::Transform& shake);
    void drawHud(const Game& game, const Vector& shake);
    void drawTutorial(const Game& game, double now);

    void renderText(const std::string& text, float x, float y, unsigned int size,
                    sf::Color color, bool centred = false);
};
