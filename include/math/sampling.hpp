#pragma once

#include "vec_math.hpp"
#include "random.hpp"

Vec3 randomVec3(Random& rng, double min, double max);

// Rejection sampling inside the unit ball.
Vec3 randomInUnitSphere(Random& rng);

Vec3 randomUnitVector(Random& rng);

// Ball sample flipped into the hemisphere around normal.
Vec3 randomInHemisphere(const Vec3& normal, Random& rng);

// Rejection sampling inside the unit disk in the z = 0 plane.
Vec3 randomInUnitDisk(Random& rng);
