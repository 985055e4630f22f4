#pragma once

#include <cstdint>
#include <vector>
#include "camera.hpp"
#include "color.hpp"
#include "hittable.hpp"
#include "image.hpp"
#include "math/random.hpp"

// Sky gradient returned for rays that leave the scene.
Color backgroundColor(const Ray& ray);

// Radiance along ray, following at most depth scatter events.
Color rayColor(const Ray& ray, const Hittable& world, int depth, Random& rng);

class Renderer {
public:
    struct Settings {
        int width;
        int height;
        int samplesPerPixel;
        int maxDepth;
        int threads;            // 0 keeps the OpenMP default
        std::uint64_t seed;
        bool fixedSeed;         // Use seed instead of a fresh random base
        bool verbose;

        Settings()
            : width(400)
            , height(225)
            , samplesPerPixel(100)
            , maxDepth(10)
            , threads(0)
            , seed(0)
            , fixedSeed(false)
            , verbose(true) {}
    };

    explicit Renderer(const Settings& settings = Settings());

    // Renders every scanline in parallel and returns the assembled image.
    // The world, camera and materials are only read.
    Image render(const Hittable& world, const Camera& camera) const;

    // Pixels of camera row j (counted from the bottom), left to right.
    std::vector<Rgb8> renderRow(const Hittable& world, const Camera& camera, int j, Random& rng) const;

    Rgb8 renderPixel(const Hittable& world, const Camera& camera, int i, int j, Random& rng) const;

    const Settings& getSettings() const { return settings; }

private:
    Settings settings;
};
