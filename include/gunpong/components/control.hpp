#ifndef GUNPONG_COMPONENTS_CONTROL_HPP
#define GUNPONG_COMPONENTS_CONTROL_HPP

#include <utility>
#include <variant>
#include <vector>

#include "gunpong/core/input.hpp"

namespace Components {

    // Any key in a list counts; the first entry is the one shown in tutorials.
    struct Controls {
        std::vector<Key> up;
        std::vector<Key> left;
        std::vector<Key> down;
        std::vector<Key> right;
    };

    struct PlayerControl {
        Controls controls;
        double nextFireTime = 0.0; // absolute time after which firing is allowed

        explicit PlayerControl(Controls c = {}, double t = 0.0)
            : controls(std::move(c)), nextFireTime(t) {}
    };

    struct AIControl {
        double unusedTimer = 0.0;
    };

    // Exactly one per paddle.
    using ControlType = std::variant<PlayerControl, AIControl>;

} // namespace Components

#endif
