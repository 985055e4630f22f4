#pragma once

#include <memory>
#include "hittable.hpp"
#include "material.hpp"

// A negative radius flips the geometric normal inward, which lets a second
// concentric sphere act as the inner wall of a hollow shell.
class Sphere : public Hittable {
public:
    Sphere(const Point3& center, double radius, std::shared_ptr<Material> material);

    bool hit(const Ray& ray, double tMin, double tMax, HitRecord& rec) const override;

    const Point3& getCenter() const { return center; }
    double getRadius() const { return radius; }
    const std::shared_ptr<Material>& getMaterial() const { return material; }

private:
    Point3 center;
    double radius;
    std::shared_ptr<Material> material;
};
