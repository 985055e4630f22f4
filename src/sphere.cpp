#include "../include/sphere.hpp"
#include <cmath>
#include <utility>

Sphere::Sphere(const Point3& center, double radius, std::shared_ptr<Material> material)
    : center(center)
    , radius(radius)
    , material(std::move(material)) {}

bool Sphere::hit(const Ray& ray, double tMin, double tMax, HitRecord& rec) const {
    Vec3 oc = ray.origin - center;
    double a = lengthSquared(ray.direction);
    double halfB = glm::dot(oc, ray.direction);
    double c = lengthSquared(oc) - radius * radius;

    double discriminant = halfB * halfB - a * c;
    if (discriminant < 0.0)
        return false;

    double sqrtd = std::sqrt(discriminant);

    // Nearest root inside the accepted range
    double root = (-halfB - sqrtd) / a;
    if (root < tMin || root > tMax) {
        root = (-halfB + sqrtd) / a;
        if (root < tMin || root > tMax)
            return false;
    }

    rec.t = root;
    rec.point = ray.at(root);
    Vec3 outwardNormal = (rec.point - center) / radius;
    rec.setFaceNormal(ray, outwardNormal);
    rec.material = material;
    return true;
}
