/**
 * @file input.hpp
 * @brief Abstract input queries consumed by the simulation.
 *
 * The simulation never talks to a device. It asks an IInputSource whether a
 * key is held or whether a global action was pressed this frame; the
 * front-end (or a test) decides how to answer.
 */

#pragma once

#include <string>
#include <vector>

/**
 * @enum Key
 * @brief Device-independent key identifiers usable in bindings.
 */
enum class Key {
    W, A, S, D,
    I, J, K, L,
    Up, Left, Down, Right,
    Space, Enter, Escape
};

/**
 * @enum Action
 * @brief Global, edge-triggered actions.
 */
enum class Action {
    Start,
    Quit
};

/**
 * @class IInputSource
 * @brief Read-only view of the input state for the current frame.
 */
class IInputSource {
public:
    virtual ~IInputSource() = default;

    /** @brief True while the key is held down. */
    virtual bool isKeyDown(Key key) const = 0;

    /** @brief True only on the frame the action went from released to pressed. */
    virtual bool wasActionPressed(Action action) const = 0;
};

/**
 * @brief True if any of the bound keys is held.
 */
bool isAnyKeyDown(const IInputSource& input, const std::vector<Key>& keys);

/**
 * @brief Short display label for a key (used by tutorial text).
 */
std::string keyName(Key key);
