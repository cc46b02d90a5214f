/**
 * @fileoverview keyboard_input.hpp
 * @brief IInputSource backed by the SFML keyboard.
 */

#pragma once

#include <array>
#include <cstddef>

#include <SFML/Window/Keyboard.hpp>

#include "gunpong/core/input.hpp"

/**
 * @class KeyboardInput
 * @brief Samples the keyboard once per frame and answers the simulation's queries.
 *
 * Actions are edge-triggered: wasActionPressed() is true only for the frame in
 * which the bound key went down.
 */
class KeyboardInput : public IInputSource {
public:
    KeyboardInput(Key startKey, Key quitKey);

    /** @brief Takes a new snapshot of every key. Call once per frame. */
    void poll();

    /** @brief Forget held keys, e.g. after the window lost focus. */
    void releaseAll();

    bool isKeyDown(Key key) const override;
    bool wasActionPressed(Action action) const override;

    /** @brief SFML key code for a binding. */
    static sf::Keyboard::Key toSfml(Key key);

private:
    static constexpr std::size_t KeyCount = static_cast<std::size_t>(Key::Escape) + 1;

    std::array<bool, KeyCount> current{};
    std::array<bool, KeyCount> previous{};
    Key startKey;
    Key quitKey;

    bool pressedThisFrame(Key key) const;
};
