#include "../include/renderer.hpp"
#include "../include/material.hpp"
#include <atomic>
#include <iostream>
#include <limits>
#include <random>
#include <omp.h>

namespace {

// Offsets the next query past the surface that spawned the ray
const double kShadowAcneEpsilon = 0.001;

std::uint64_t freshSeed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

} // namespace

Color backgroundColor(const Ray& ray) {
    Vec3 unitDirection = unitVector(ray.direction);
    double t = 0.5 * (unitDirection.y + 1.0);
    return (1.0 - t) * Color(1.0, 1.0, 1.0) + t * Color(0.5, 0.7, 1.0);
}

Color rayColor(const Ray& ray, const Hittable& world, int depth, Random& rng) {
    if (depth <= 0) {
        return Color(0.0);
    }

    HitRecord rec;
    if (!world.hit(ray, kShadowAcneEpsilon, std::numeric_limits<double>::infinity(), rec)) {
        return backgroundColor(ray);
    }

    Color attenuation;
    Ray scattered;
    if (rec.material && rec.material->scatter(ray, rec, rng, attenuation, scattered)) {
        return attenuation * rayColor(scattered, world, depth - 1, rng);
    }
    return Color(0.0);
}

Renderer::Renderer(const Settings& settings)
    : settings(settings) {}

Rgb8 Renderer::renderPixel(const Hittable& world, const Camera& camera, int i, int j, Random& rng) const {
    Color pixelColor(0.0);
    for (int s = 0; s < settings.samplesPerPixel; ++s) {
        double u = (i + rng.uniform()) / (settings.width - 1);
        double v = (j + rng.uniform()) / (settings.height - 1);
        Ray ray = camera.getRay(u, v, rng);
        pixelColor += rayColor(ray, world, settings.maxDepth, rng);
    }
    return toRgb8(pixelColor, settings.samplesPerPixel);
}

std::vector<Rgb8> Renderer::renderRow(const Hittable& world, const Camera& camera, int j, Random& rng) const {
    std::vector<Rgb8> row;
    row.reserve(settings.width);
    for (int i = 0; i < settings.width; ++i) {
        row.push_back(renderPixel(world, camera, i, j, rng));
    }
    return row;
}

Image Renderer::render(const Hittable& world, const Camera& camera) const {
    const int height = settings.height;
    const int threads = settings.threads > 0 ? settings.threads : omp_get_max_threads();
    const std::uint64_t baseSeed = settings.fixedSeed ? settings.seed : freshSeed();

    if (settings.verbose) {
        std::cout << "Starting render with settings:" << std::endl;
        std::cout << "Resolution: " << settings.width << "x" << settings.height << std::endl;
        std::cout << "Samples per pixel: " << settings.samplesPerPixel << std::endl;
        std::cout << "Max depth: " << settings.maxDepth << std::endl;
        std::cout << "Threads: " << threads << std::endl;
        if (settings.fixedSeed) {
            std::cout << "Seed: " << settings.seed << std::endl;
        }
    }

    // One buffer per camera row, each written by exactly one worker
    std::vector<std::vector<Rgb8>> rows(height);
    std::atomic<int> rowsCompleted{0};
    std::atomic<int> lastPercentage{0};

    #pragma omp parallel for schedule(dynamic, 1) num_threads(threads)
    for (int j = 0; j < height; ++j) {
        Random rowRng(mixSeed(baseSeed, static_cast<std::uint64_t>(j)));
        rows[j] = renderRow(world, camera, j, rowRng);

        int completed = ++rowsCompleted;
        if (settings.verbose) {
            int percentage = (completed * 100) / height;
            int oldPercentage = lastPercentage.load();
            if (percentage > oldPercentage &&
                lastPercentage.compare_exchange_strong(oldPercentage, percentage)) {
                #pragma omp critical
                {
                    std::cout << "\rRendering progress: " << percentage << "% ("
                              << completed << "/" << height << " rows)" << std::flush;
                }
            }
        }
    }

    // Camera rows run bottom to top; image rows run top to bottom
    Image image(settings.width, height);
    for (int j = 0; j < height; ++j) {
        int y = height - 1 - j;
        for (int x = 0; x < settings.width; ++x) {
            image.setPixel(x, y, rows[j][x]);
        }
    }

    if (settings.verbose) {
        std::cout << "\nRendering completed" << std::endl;
    }
    return image;
}
