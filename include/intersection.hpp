#pragma once

#include <memory>
#include "ray.hpp"

class Material;

struct HitRecord {
    Point3 point = Point3(0.0);               // Hit position
    Vec3 normal = Vec3(0.0);                  // Unit normal, always against the ray
    double t = 0.0;                           // Ray parameter
    bool frontFace = false;                   // Ray arrived on the outward side
    std::shared_ptr<Material> material;       // Shared with the surface

    HitRecord() = default;

    void setFaceNormal(const Ray& ray, const Vec3& outwardNormal) {
        frontFace = glm::dot(ray.direction, outwardNormal) < 0.0;
        normal = frontFace ? outwardNormal : -outwardNormal;
    }
};
