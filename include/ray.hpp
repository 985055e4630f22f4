#pragma once

#include "math/vec_math.hpp"

// The direction is not normalized; intersection code accounts for its length.
struct Ray {
    Point3 origin;
    Vec3 direction;

    Ray() : origin(0.0), direction(0.0) {}
    Ray(const Point3& o, const Vec3& d)
        : origin(o), direction(d) {}

    Point3 at(double t) const {
        return origin + t * direction;
    }
};
