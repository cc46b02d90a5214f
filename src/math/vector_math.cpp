#include "gunpong/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(float a, float b, float epsilon) {
    return std::fabs(a - b) < epsilon;
}

Vector::Vector() : x(0.0F), y(0.0F) {}

Vector::Vector(float x, float y) : x(x), y(y) {}

Vector Vector::operator-() const {
    return {-x, -y};
}

Vector Vector::operator+(const Vector& b) const {
    return {x + b.x, y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
    return {x - b.x, y - b.y};
}

Vector Vector::operator*(float scalar) const {
    return {x * scalar, y * scalar};
}

Vector Vector::operator/(float scalar) const {
    return {x / scalar, y / scalar};
}

Vector& Vector::operator+=(const Vector& v) {
    x += v.x;
    y += v.y;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    x -= v.x;
    y -= v.y;
    return *this;
}

Vector& Vector::operator*=(float scalar) {
    x *= scalar;
    y *= scalar;
    return *this;
}

bool Vector::operator==(const Vector& other) const {
    return x == other.x && y == other.y;
}

bool Vector::operator!=(const Vector& other) const {
    return !(*this == other);
}

float Vector::length() const {
    return std::sqrt(lengthSquared());
}

float Vector::lengthSquared() const {
    return x * x + y * y;
}

float Vector::dotProduct(const Vector& v) const {
    return x * v.x + y * v.y;
}

Vector Vector::componentDivide(const Vector& divisor) const {
    return {x / divisor.x, y / divisor.y};
}

Vector Vector::normalized() const {
    float const len = length();
    if (len == 0.0F) {
        return *this;
    }
    return {x / len, y / len};
}
