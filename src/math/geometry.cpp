#include "gunpong/math/geometry.hpp"

#include <cmath>

namespace Geometry {

float squaredDistance(const Vector& p, const Vector& q) {
    return (p - q).lengthSquared();
}

float squaredDistancePointSegment(const Vector& a, const Vector& b, const Vector& c) {
    Vector const ab = b - a;
    Vector const ac = c - a;
    Vector const bc = c - b;

    float const e = ac.dotProduct(ab);
    // c projects outside the segment on a's side
    if (e <= 0.0F) {
        return ac.lengthSquared();
    }
    float const f = ab.lengthSquared();
    // ... or on b's side
    if (e >= f) {
        return bc.lengthSquared();
    }
    return ac.lengthSquared() - e * e / f;
}

bool sphereCapsuleOverlap(const Vector& sphereCenter,
                          float sphereRadius,
                          const Vector& capsuleCenter,
                          float capsuleHalfWidth,
                          float capsuleHalfHeight)
{
    Vector const top(capsuleCenter.x, capsuleCenter.y + capsuleHalfHeight);
    Vector const bottom(capsuleCenter.x, capsuleCenter.y - capsuleHalfHeight);

    float const dist2 = squaredDistancePointSegment(top, bottom, sphereCenter);
    float const reach = sphereRadius + capsuleHalfWidth;
    return dist2 <= reach * reach;
}

bool redirect(Vector& velocity, const Vector& direction, float speed) {
    float const magnitude = direction.length();
    if (magnitude == 0.0F || !std::isfinite(magnitude)) {
        return false;
    }
    velocity = direction * (speed / magnitude);
    return true;
}

} // namespace Geometry
