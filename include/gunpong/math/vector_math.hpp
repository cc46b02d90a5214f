/**
 * @file vector_math.hpp
 * @brief 2D vector mathematics for positions and velocities
 *
 * This file provides the single geometric primitive used by the game:
 * - Vector class for positions, velocities and directions on the field
 * - Arithmetic and component-wise operations
 * - Utility functions for floating-point comparisons
 */

#ifndef GUNPONG_VECTOR_MATH_HPP
#define GUNPONG_VECTOR_MATH_HPP

/**
 * @brief Threshold for floating point equality tests
 */
constexpr float EPSILON = 1e-5F;

/**
 * @brief Compares two floats for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(float a, float b, float epsilon = EPSILON);

/**
 * @brief Represents a 2D vector in field units (pixels)
 *
 * Used both for absolute positions and for per-substep velocities.
 */
class Vector {
public:
    float x;  ///< X component (grows to the right)
    float y;  ///< Y component (grows downwards)

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(float x, float y);

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;

    /**
     * @brief Scales vector by scalar value
     * @param scalar Scale factor
     * @return Scaled vector
     */
    Vector operator*(float scalar) const;

    /**
     * @brief Divides vector by scalar value
     * @param scalar Divisor
     * @return Divided vector
     */
    Vector operator/(float scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(float scalar);

    bool operator==(const Vector& other) const;
    bool operator!=(const Vector& other) const;

    /** @brief Returns vector magnitude */
    float length() const;

    /** @brief Returns squared magnitude, avoiding the square root */
    float lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    float dotProduct(const Vector& v) const;

    /**
     * @brief Divides each component by the matching component of another vector
     * @param divisor Per-axis divisor
     * @return (x / divisor.x, y / divisor.y)
     */
    Vector componentDivide(const Vector& divisor) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * A zero vector is returned unchanged.
     */
    Vector normalized() const;
};

#endif
