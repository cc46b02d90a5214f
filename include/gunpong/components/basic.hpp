#ifndef GUNPONG_COMPONENTS_BASIC_HPP
#define GUNPONG_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "gunpong/math/vector_math.hpp"

namespace Components {

    // Position and per-substep velocity, in field pixels
    struct Transform {
        Vector position;
        Vector velocity;

        Transform(Vector p = {}, Vector v = {}) : position(p), velocity(v) {}
    };

    // Vertical capsule centred on the Transform.
    // halfHeight is the paddle's remaining "health" and never drops below 0.
    struct Bounds {
        float halfWidth = 16.0F;
        float halfHeight = 64.0F;

        Bounds(float hw = 16.0F, float hh = 64.0F) : halfWidth(hw), halfHeight(hh) {}
    };

    struct Ball {
        float radius = 16.0F;
        float speed = 1.0F; // magnitude re-applied after every bounce, always > 0

        Ball(float r = 16.0F, float s = 1.0F) : radius(r), speed(s) {}
    };

    struct Bullet {
        float radius = 2.0F;

        explicit Bullet(float r = 2.0F) : radius(r) {}
    };

    struct Color {
        uint8_t r, g, b, a;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255, uint8_t a = 255)
            : r(r), g(g), b(b), a(a) {}

        bool operator==(const Color& other) const {
            return r == other.r && g == other.g && b == other.b && a == other.a;
        }
    };

    namespace Colors {
        const Color White{255, 255, 255};
        const Color Black{0, 0, 0};
        const Color Gray{130, 130, 130};
        const Color Red{230, 41, 55};
        const Color Blue{0, 121, 241};
        const Color Trail{0, 0, 0, 96};
    } // namespace Colors

} // namespace Components

#endif
