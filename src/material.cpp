#include "../include/material.hpp"
#include "../include/math/sampling.hpp"
#include <cmath>

bool Lambertian::scatter(const Ray& /*rayIn*/, const HitRecord& rec, Random& rng,
                         Color& attenuation, Ray& scattered) const {
    Vec3 scatterDirection = rec.normal + randomUnitVector(rng);

    // The random vector can cancel the normal almost exactly
    if (nearZero(scatterDirection))
        scatterDirection = rec.normal;

    scattered = Ray(rec.point, scatterDirection);
    attenuation = albedo;
    return true;
}

bool Metal::scatter(const Ray& rayIn, const HitRecord& rec, Random& rng,
                    Color& attenuation, Ray& scattered) const {
    Vec3 reflected = reflect(unitVector(rayIn.direction), rec.normal);
    scattered = Ray(rec.point, reflected + fuzz * randomInUnitSphere(rng));
    attenuation = albedo;
    return glm::dot(scattered.direction, rec.normal) > 0.0;
}

bool Dielectric::scatter(const Ray& rayIn, const HitRecord& rec, Random& rng,
                         Color& attenuation, Ray& scattered) const {
    attenuation = Color(1.0, 1.0, 1.0);
    double refractionRatio = rec.frontFace ? (1.0 / ior) : ior;

    Vec3 unitDirection = unitVector(rayIn.direction);
    double cosTheta = std::fmin(glm::dot(-unitDirection, rec.normal), 1.0);
    double sinTheta = std::sqrt(1.0 - cosTheta * cosTheta);

    bool cannotRefract = refractionRatio * sinTheta > 1.0;
    Vec3 direction;
    if (cannotRefract ||
        MaterialUtils::schlickReflectance(cosTheta, refractionRatio) > rng.uniform()) {
        direction = reflect(unitDirection, rec.normal);
    } else {
        direction = refract(unitDirection, rec.normal, refractionRatio);
    }

    scattered = Ray(rec.point, direction);
    return true;
}
