#pragma once

#include "ray.hpp"
#include "intersection.hpp"
#include "math/random.hpp"

// Decides how a ray continues after striking a surface. Returning false
// means the ray is absorbed. Implementations hold no mutable state and may
// be shared by any number of surfaces and threads.
class Material {
public:
    virtual ~Material() = default;

    virtual bool scatter(const Ray& rayIn, const HitRecord& rec, Random& rng,
                         Color& attenuation, Ray& scattered) const = 0;
};

class Lambertian : public Material {
public:
    explicit Lambertian(const Color& albedo) : albedo(albedo) {}

    bool scatter(const Ray& rayIn, const HitRecord& rec, Random& rng,
                 Color& attenuation, Ray& scattered) const override;

    const Color& getAlbedo() const { return albedo; }

private:
    Color albedo;
};

class Metal : public Material {
public:
    Metal(const Color& albedo, double fuzz) : albedo(albedo), fuzz(fuzz) {}

    bool scatter(const Ray& rayIn, const HitRecord& rec, Random& rng,
                 Color& attenuation, Ray& scattered) const override;

    const Color& getAlbedo() const { return albedo; }
    double getFuzz() const { return fuzz; }

private:
    Color albedo;
    double fuzz;
};

class Dielectric : public Material {
public:
    explicit Dielectric(double indexOfRefraction) : ior(indexOfRefraction) {}

    bool scatter(const Ray& rayIn, const HitRecord& rec, Random& rng,
                 Color& attenuation, Ray& scattered) const override;

    double getIndexOfRefraction() const { return ior; }

private:
    double ior;
};

namespace MaterialUtils {
    // Schlick's approximation of Fresnel reflectance.
    inline double schlickReflectance(double cosine, double refIdx) {
        double r0 = (1.0 - refIdx) / (1.0 + refIdx);
        r0 = r0 * r0;
        double x = 1.0 - cosine;
        double x2 = x * x;
        double x5 = x2 * x2 * x;
        return r0 + (1.0 - r0) * x5;
    }
};
