#pragma once

#include <cmath>
#include <glm/glm.hpp>

// Points, directions and colors share one double-precision type.
using Vec3 = glm::dvec3;
using Point3 = glm::dvec3;
using Color = glm::dvec3;

inline double lengthSquared(const Vec3& v) {
    return glm::dot(v, v);
}

// Not guarded: a zero-length input yields NaN components.
inline Vec3 unitVector(const Vec3& v) {
    return v / glm::length(v);
}

inline bool nearZero(const Vec3& v) {
    const double s = 1e-8;
    return std::fabs(v.x) < s && std::fabs(v.y) < s && std::fabs(v.z) < s;
}

inline Vec3 reflect(const Vec3& v, const Vec3& n) {
    return v - 2.0 * glm::dot(v, n) * n;
}

// Snell's law split into the components perpendicular and parallel to n.
// uv is expected to be unit length; the cosine is clamped against overshoot.
inline Vec3 refract(const Vec3& uv, const Vec3& n, double etaiOverEtat) {
    double cosTheta = std::fmin(glm::dot(-uv, n), 1.0);
    Vec3 rOutPerp = etaiOverEtat * (uv + cosTheta * n);
    Vec3 rOutParallel = -std::sqrt(std::fabs(1.0 - lengthSquared(rOutPerp))) * n;
    return rOutPerp + rOutParallel;
}
