/**
 * @fileoverview presentation_manager.cpp
 * @brief Implementation of PresentationManager.
 */

#include "gunpong/app/presentation_manager.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <variant>

#include "gunpong/app/keyboard_input.hpp"
#include "gunpong/components/basic.hpp"
#include "gunpong/components/control.hpp"
#include "gunpong/core/profile.hpp"

namespace {

sf::Color toSfml(const Components::Color& c) {
    return {c.r, c.g, c.b, c.a};
}

sf::Uint8 channel(float value) {
    return static_cast<sf::Uint8>(std::clamp(value, 0.0F, 1.0F) * 255.0F);
}

void drawCircle(sf::RenderTarget& target, const Vector& centre, float radius, sf::Color color,
                const sf::Transform& transform) {
    sf::CircleShape circle(radius);
    circle.setOrigin(radius, radius);
    circle.setPosition(centre.x, centre.y);
    circle.setFillColor(color);
    target.draw(circle, transform);
}

} // namespace

PresentationManager::PresentationManager(unsigned int screenWidth, unsigned int screenHeight)
    : screenWidth(screenWidth)
    , screenHeight(screenHeight)
{}

bool PresentationManager::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Gun Pong");
    if (!window.isOpen()) {
        std::cerr << "Failed to create the game window" << std::endl;
        return false;
    }
    window.setFramerateLimit(GameConstants::FramesPerSecond);

    fontLoaded = font.loadFromFile("assets/fonts/arial.ttf");
    if (!fontLoaded) {
        std::cerr << "Failed to load font assets/fonts/arial.ttf, HUD text disabled" << std::endl;
    }
    return true;
}

void PresentationManager::handleEvents(KeyboardInput& input) {
    sf::Event event;
    while (window.pollEvent(event)) {
        if (event.type == sf::Event::Closed) {
            window.close();
            return;
        }
        if (event.type == sf::Event::LostFocus) {
            input.releaseAll();
        }
    }
}

void PresentationManager::renderFrame(const Game& game, double now) {
    PROFILE_SCOPE("PresentationManager::renderFrame");
    const auto& match = game.getMatchState();

    backdrop = Hud::ease(backdrop, Hud::targetBackdrop(match));
    window.clear(sf::Color(channel(backdrop.r), channel(backdrop.g), channel(backdrop.b)));

    Vector const shake = Hud::shakeOffset(game.getFrameCount(), match.hitstun);
    sf::Transform shakeTransform;
    shakeTransform.translate(shake.x, shake.y);

    // Particles are background and do not shake
    drawParticles(game, now, sf::Transform::Identity);
    drawHud(game, shake);
    drawBodies(game, shakeTransform);
    if (match.phase != Components::Phase::Ongoing) {
        drawTutorial(game, now);
    }

    window.display();
}

void PresentationManager::drawParticles(const Game& game, double now, const sf::Transform& transform) {
    PROFILE_SCOPE("PresentationManager::drawParticles");
    for (const auto& p : game.getParticles().getParticles()) {
        float const radius = std::max(0.0F, p.size * p.lifeFraction(now));
        if (radius <= 0.0F) {
            continue;
        }
        drawCircle(window, p.position, radius, toSfml(p.color), transform);
    }
}

void PresentationManager::drawBodies(const Game& game, const sf::Transform& shake) {
    const auto& store = game.getStore();

    for (auto [entity, transform, bullet] : store.query<Components::Transform, Components::Bullet>().each()) {
        (void)entity;
        (void)bullet;
        drawCircle(window, transform.position, 8.0F, sf::Color::Black, shake);
        drawCircle(window, transform.position, 4.0F, sf::Color::White, shake);
    }

    for (auto [entity, transform, ball] : store.query<Components::Transform, Components::Ball>().each()) {
        (void)entity;
        sf::CircleShape outline(ball.radius);
        outline.setOrigin(ball.radius, ball.radius);
        outline.setPosition(transform.position.x, transform.position.y);
        outline.setFillColor(sf::Color::Transparent);
        outline.setOutlineColor(sf::Color::White);
        outline.setOutlineThickness(-2.0F);
        window.draw(outline, shake);
        drawCircle(window, transform.position, 2.0F, sf::Color::Black, shake);
    }

    for (auto [entity, transform, bounds] : store.query<Components::Transform, Components::Bounds>().each()) {
        (void)entity;
        sf::RectangleShape rect(sf::Vector2f(bounds.halfWidth * 2.0F, bounds.halfHeight * 2.0F));
        rect.setPosition(transform.position.x - bounds.halfWidth, transform.position.y - bounds.halfHeight);
        rect.setFillColor(sf::Color::Black);
        rect.setOutlineColor(sf::Color::White);
        rect.setOutlineThickness(-4.0F);
        window.draw(rect, shake);
    }
}

void PresentationManager::drawHud(const Game& game, const Vector& shake) {
    if (!fontLoaded) {
        return;
    }
    const auto& match = game.getMatchState();
    float const centreX = static_cast<float>(screenWidth) / 2.0F + shake.x;
    float const height = static_cast<float>(screenHeight);

    renderText(Hud::phaseText(match.phase), centreX, 40.0F + shake.y, 32, sf::Color::White, true);
    renderText(Hud::scoreText(match), centreX, height - 88.0F + shake.y, 32, sf::Color::White, true);
    renderText(Hud::intensityText(match), centreX, height - 56.0F + shake.y, 32, sf::Color::White, true);
}

void PresentationManager::drawTutorial(const Game& game, double now) {
    if (!fontLoaded) {
        return;
    }
    sf::Color const color = std::fmod(now * 1.1, 2.0) < 1.0
                          ? toSfml(Components::Colors::White)
                          : toSfml(Components::Colors::Gray);

    const auto& store = game.getStore();
    auto view = store.query<Components::Transform, Components::ControlType, Components::Bounds>();
    for (auto [entity, transform, control, bounds] : view.each()) {
        (void)entity;
        const Vector& p = transform.position;
        if (const auto* player = std::get_if<Components::PlayerControl>(&control)) {
            const auto& keys = player->controls;
            if (!keys.up.empty()) {
                renderText(keyName(keys.up.front()), p.x, p.y - bounds.halfHeight - 44.0F, 36, color, true);
            }
            if (!keys.down.empty()) {
                renderText(keyName(keys.down.front()), p.x, p.y + bounds.halfHeight + 4.0F, 36, color, true);
            }
            if (!keys.left.empty()) {
                renderText(keyName(keys.left.front()), p.x - bounds.halfWidth - 24.0F, p.y - 20.0F, 36, color, true);
            }
            if (!keys.right.empty()) {
                renderText(keyName(keys.right.front()), p.x + bounds.halfWidth + 24.0F, p.y - 20.0F, 36, color, true);
            }
        } else {
            renderText("AUTO", p.x, p.y - bounds.halfHeight - 44.0F, 36, color, true);
        }
    }
}

void PresentationManager::renderText(const std::string& text, float x, float y, unsigned int size,
                                     sf::Color color, bool centred) {
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(size);
    sfText.setFillColor(color);
    if (centred) {
        x -= sfText.getLocalBounds().width / 2.0F;
    }
    sfText.setPosition(x, y);
    window.draw(sfText);
}
