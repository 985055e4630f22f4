#pragma once

#include <memory>
#include <vector>
#include "hittable.hpp"

// Ordered list of surfaces. Geometry is owned here; materials are shared.
class Scene : public Hittable {
public:
    Scene() = default;

    void add(std::unique_ptr<Hittable> object);
    void clear();

    size_t size() const { return objects.size(); }
    bool empty() const { return objects.empty(); }

    bool hit(const Ray& ray, double tMin, double tMax, HitRecord& rec) const override;

private:
    std::vector<std::unique_ptr<Hittable>> objects;
};
