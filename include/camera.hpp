#pragma once

#include <cmath>
#include <glm/glm.hpp>
#include "ray.hpp"
#include "math/random.hpp"
#include "math/sampling.hpp"

class Camera {
public:
    Camera(
        const Point3& lookFrom = Point3(0.0, 0.0, 0.0),
        const Point3& lookAt = Point3(0.0, 0.0, -1.0),
        const Vec3& up = Vec3(0.0, 1.0, 0.0),
        double verticalFOV = 90.0,
        double aspectRatio = 16.0 / 9.0,
        double aperture = 0.0,
        double focusDistance = 1.0
    ) : origin(lookFrom) {
        double theta = glm::radians(verticalFOV);
        double h = std::tan(theta / 2.0);
        double viewportHeight = 2.0 * h;
        double viewportWidth = aspectRatio * viewportHeight;

        w = unitVector(lookFrom - lookAt);
        u = unitVector(glm::cross(up, w));
        v = glm::cross(w, u);

        horizontal = focusDistance * viewportWidth * u;
        vertical = focusDistance * viewportHeight * v;
        lowerLeftCorner = origin - horizontal / 2.0 - vertical / 2.0 - focusDistance * w;

        lensRadius = aperture / 2.0;
    }

    // s and t are normalized image coordinates; (0, 0) is the lower-left
    // corner of the viewport. Every ray for a given (s, t) passes through the
    // same point on the focus plane.
    Ray getRay(double s, double t, Random& rng) const {
        Point3 target = lowerLeftCorner + s * horizontal + t * vertical;

        if (lensRadius <= 0.0) {
            // Pinhole camera model
            return Ray(origin, target - origin);
        }

        // Thin lens model for depth of field
        Vec3 rd = lensRadius * randomInUnitDisk(rng);
        Vec3 offset = u * rd.x + v * rd.y;
        return Ray(origin + offset, target - origin - offset);
    }

    const Point3& getOrigin() const { return origin; }
    const Point3& getLowerLeftCorner() const { return lowerLeftCorner; }
    const Vec3& getHorizontal() const { return horizontal; }
    const Vec3& getVertical() const { return vertical; }
    const Vec3& getU() const { return u; }
    const Vec3& getV() const { return v; }
    const Vec3& getW() const { return w; }
    double getLensRadius() const { return lensRadius; }

private:
    Point3 origin;
    Point3 lowerLeftCorner;
    Vec3 horizontal;
    Vec3 vertical;
    Vec3 u, v, w;
    double lensRadius;
};
