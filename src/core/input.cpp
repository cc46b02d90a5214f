#include "gunpong/core/input.hpp"

#include <algorithm>

bool isAnyKeyDown(const IInputSource& input, const std::vector<Key>& keys) {
    return std::any_of(keys.begin(), keys.end(),
                       [&input](Key key) { return input.isKeyDown(key); });
}

std::string keyName(Key key) {
    switch (key) {
        case Key::W:      return "W";
        case Key::A:      return "A";
        case Key::S:      return "S";
        case Key::D:      return "D";
        case Key::I:      return "I";
        case Key::J:      return "J";
        case Key::K:      return "K";
        case Key::L:      return "L";
        case Key::Up:     return "Up";
        case Key::Left:   return "Left";
        case Key::Down:   return "Down";
        case Key::Right:  return "Right";
        case Key::Space:  return "Space";
        case Key::Enter:  return "Enter";
        case Key::Escape: return "Escape";
        default: return "?";
    }
}
