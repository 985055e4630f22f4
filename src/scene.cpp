#include "../include/scene.hpp"
#include <utility>

void Scene::add(std::unique_ptr<Hittable> object) {
    objects.push_back(std::move(object));
}

void Scene::clear() {
    objects.clear();
}

bool Scene::hit(const Ray& ray, double tMin, double tMax, HitRecord& rec) const {
    HitRecord candidate;
    bool hitAnything = false;
    double closestSoFar = tMax;

    // Each hit shrinks the interval, so farther surfaces reject themselves
    for (const auto& object : objects) {
        if (object->hit(ray, tMin, closestSoFar, candidate)) {
            hitAnything = true;
            closestSoFar = candidate.t;
            rec = candidate;
        }
    }

    return hitAnything;
}
