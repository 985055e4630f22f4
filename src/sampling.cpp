#include "../include/math/sampling.hpp"

Vec3 randomVec3(Random& rng, double min, double max) {
    double x = rng.uniform(min, max);
    double y = rng.uniform(min, max);
    double z = rng.uniform(min, max);
    return Vec3(x, y, z);
}

Vec3 randomInUnitSphere(Random& rng) {
    while (true) {
        Vec3 p = randomVec3(rng, -1.0, 1.0);
        if (lengthSquared(p) < 1.0)
            return p;
    }
}

Vec3 randomUnitVector(Random& rng) {
    return unitVector(randomInUnitSphere(rng));
}

Vec3 randomInHemisphere(const Vec3& normal, Random& rng) {
    Vec3 inUnitSphere = randomInUnitSphere(rng);
    return glm::dot(inUnitSphere, normal) > 0.0 ? inUnitSphere : -inUnitSphere;
}

Vec3 randomInUnitDisk(Random& rng) {
    while (true) {
        double x = rng.uniform(-1.0, 1.0);
        double y = rng.uniform(-1.0, 1.0);
        Vec3 p(x, y, 0.0);
        if (lengthSquared(p) < 1.0)
            return p;
    }
}
