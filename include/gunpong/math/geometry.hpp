/**
 * @file geometry.hpp
 * @brief Distance queries and overlap tests for circles and vertical capsules
 *
 * All distance functions return squared distances so callers never pay for
 * a square root when comparing against a (squared) radius.
 */

#ifndef GUNPONG_GEOMETRY_HPP
#define GUNPONG_GEOMETRY_HPP

#include "gunpong/math/vector_math.hpp"

namespace Geometry {

/**
 * @brief Squared Euclidean distance between two points
 */
float squaredDistance(const Vector& p, const Vector& q);

/**
 * @brief Squared distance from point c to the segment a-b
 *
 * Uses the projection clamp: if c projects at or before a the distance to a
 * is returned, at or beyond b the distance to b, otherwise the perpendicular
 * distance to the line. Endpoints win at the boundaries.
 *
 * @param a Segment start
 * @param b Segment end
 * @param c Query point
 * @return Squared distance
 */
float squaredDistancePointSegment(const Vector& a, const Vector& b, const Vector& c);

/**
 * @brief Tests a circle against a vertical capsule
 *
 * The capsule's core segment runs from capsuleCenter - (0, halfHeight) to
 * capsuleCenter + (0, halfHeight) and is inflated by halfWidth. A zero
 * halfHeight reduces this to a circle-circle test.
 *
 * @return true if the shapes touch or overlap
 */
bool sphereCapsuleOverlap(const Vector& sphereCenter,
                          float sphereRadius,
                          const Vector& capsuleCenter,
                          float capsuleHalfWidth,
                          float capsuleHalfHeight);

/**
 * @brief Points a velocity along a new direction with a fixed magnitude
 *
 * @param velocity Velocity to overwrite
 * @param direction Desired (unnormalized) direction
 * @param speed Magnitude of the resulting velocity
 * @return false, leaving velocity untouched, when direction has zero length
 */
bool redirect(Vector& velocity, const Vector& direction, float speed);

} // namespace Geometry

#endif
