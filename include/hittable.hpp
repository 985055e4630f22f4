#pragma once

#include "ray.hpp"
#include "intersection.hpp"

class Hittable {
public:
    virtual ~Hittable() = default;

    // Reports the closest hit with t in [tMin, tMax]. rec is only written
    // when the call returns true.
    virtual bool hit(const Ray& ray, double tMin, double tMax, HitRecord& rec) const = 0;
};
