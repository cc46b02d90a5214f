/**
 * @fileoverview keyboard_input.cpp
 * @brief Implementation of KeyboardInput.
 */

#include "gunpong/app/keyboard_input.hpp"

KeyboardInput::KeyboardInput(Key startKey, Key quitKey)
    : startKey(startKey)
    , quitKey(quitKey)
{}

sf::Keyboard::Key KeyboardInput::toSfml(Key key) {
    switch (key) {
        case Key::W:      return sf::Keyboard::W;
        case Key::A:      return sf::Keyboard::A;
        case Key::S:      return sf::Keyboard::S;
        case Key::D:      return sf::Keyboard::D;
        case Key::I:      return sf::Keyboard::I;
        case Key::J:      return sf::Keyboard::J;
        case Key::K:      return sf::Keyboard::K;
        case Key::L:      return sf::Keyboard::L;
        case Key::Up:     return sf::Keyboard::Up;
        case Key::Left:   return sf::Keyboard::Left;
        case Key::Down:   return sf::Keyboard::Down;
        case Key::Right:  return sf::Keyboard::Right;
        case Key::Space:  return sf::Keyboard::Space;
        case Key::Enter:  return sf::Keyboard::Enter;
        case Key::Escape: return sf::Keyboard::Escape;
        default: return sf::Keyboard::Unknown;
    }
}

void KeyboardInput::poll() {
    previous = current;
    for (std::size_t i = 0; i < KeyCount; ++i) {
        current[i] = sf::Keyboard::isKeyPressed(toSfml(static_cast<Key>(i)));
    }
}

void KeyboardInput::releaseAll() {
    current.fill(false);
    previous.fill(false);
}

bool KeyboardInput::isKeyDown(Key key) const {
    return current[static_cast<std::size_t>(key)];
}

bool KeyboardInput::pressedThisFrame(Key key) const {
    auto const i = static_cast<std::size_t>(key);
    return current[i] && !previous[i];
}

bool KeyboardInput::wasActionPressed(Action action) const {
    switch (action) {
        case Action::Start: return pressedThisFrame(startKey);
        case Action::Quit:  return pressedThisFrame(quitKey);
        default: return false;
    }
}
