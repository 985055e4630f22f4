#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include "material.hpp"
#include "renderer.hpp"
#include "scene.hpp"
#include "sphere.hpp"
#include "world.hpp"

namespace {

Renderer::Settings quietSettings(int width, int height, int samples, int depth) {
    Renderer::Settings settings;
    settings.width = width;
    settings.height = height;
    settings.samplesPerPixel = samples;
    settings.maxDepth = depth;
    settings.verbose = false;
    return settings;
}

Camera lookDownNegativeZ(double aspect) {
    return Camera(Point3(0.0), Point3(0.0, 0.0, -1.0), Vec3(0.0, 1.0, 0.0), 90.0, aspect, 0.0, 1.0);
}

// Replays the sample sequence of renderPixel for a ray that hits nothing.
Rgb8 expectedBackground(const Renderer::Settings& settings, const Camera& camera,
                        int i, int j, Random& rng) {
    Color sum(0.0);
    for (int s = 0; s < settings.samplesPerPixel; ++s) {
        double u = (i + rng.uniform()) / (settings.width - 1);
        double v = (j + rng.uniform()) / (settings.height - 1);
        sum += backgroundColor(camera.getRay(u, v, rng));
    }
    return toRgb8(sum, settings.samplesPerPixel);
}

double meanAbsoluteDifference(const Image& a, const Image& b) {
    double total = 0.0;
    for (size_t i = 0; i < a.pixels.size(); ++i) {
        total += std::abs(static_cast<int>(a.pixels[i]) - static_cast<int>(b.pixels[i]));
    }
    return total / a.pixels.size();
}

} // namespace

TEST(RayColor, ExhaustedDepthIsBlack) {
    Scene world = buildDefaultWorld();
    Random rng(1);
    Color c = rayColor(Ray(Point3(0.0), Vec3(0.0, 1.0, 0.0)), world, 0, rng);
    EXPECT_EQ(c, Color(0.0));
}

TEST(RayColor, MissReturnsSkyGradient) {
    Scene empty;
    Random rng(2);
    Color up = rayColor(Ray(Point3(0.0), Vec3(0.0, 5.0, 0.0)), empty, 3, rng);
    Color down = rayColor(Ray(Point3(0.0), Vec3(0.0, -1.0, 0.0)), empty, 3, rng);
    EXPECT_EQ(up, Color(0.5, 0.7, 1.0));
    EXPECT_EQ(down, Color(1.0, 1.0, 1.0));
}

TEST(RayColor, MultipliesAttenuationAlongThePath) {
    // Inside a closed mirror ball every bounce scatters, so the result is
    // albedo^depth times black at the end of the budget
    Scene world;
    world.add(std::make_unique<Sphere>(Point3(0.0), 10.0, std::make_shared<Metal>(Color(0.5), 0.0)));
    Random rng(3);
    Color c = rayColor(Ray(Point3(0.0), Vec3(0.3, 0.2, 1.0)), world, 8, rng);
    EXPECT_EQ(c, Color(0.0));
}

TEST(RayColor, LightsUpThroughDiffuseBounce) {
    Scene world;
    world.add(std::make_unique<Sphere>(Point3(0.0, 0.0, -1.0), 0.5,
                                       std::make_shared<Lambertian>(Color(0.5, 0.5, 0.5))));
    Random rng(4);
    Color c = rayColor(Ray(Point3(0.0), Vec3(0.0, 0.0, -1.0)), world, 10, rng);
    // One diffuse bounce off the front face sees sky at half strength
    EXPECT_GT(c.b, 0.0);
    EXPECT_LE(c.b, 0.5 + 1e-12);
}

TEST(Renderer, EmptySceneReproducesBackgroundEverywhere) {
    Renderer::Settings settings = quietSettings(12, 8, 3, 1);
    settings.fixedSeed = true;
    settings.seed = 1234;
    Renderer renderer(settings);
    Camera camera = lookDownNegativeZ(12.0 / 8.0);
    Scene empty;

    Image image = renderer.render(empty, camera);
    ASSERT_EQ(image.width, 12);
    ASSERT_EQ(image.height, 8);

    for (int j = 0; j < settings.height; ++j) {
        Random replay(mixSeed(settings.seed, static_cast<std::uint64_t>(j)));
        for (int i = 0; i < settings.width; ++i) {
            Rgb8 expected = expectedBackground(settings, camera, i, j, replay);
            EXPECT_EQ(image.getPixel(i, settings.height - 1 - j), expected) << "pixel " << i << "," << j;
        }
    }
}

TEST(Renderer, SingleSphereCenterHitsAndCornersSeeSky) {
    Renderer::Settings settings = quietSettings(21, 21, 1, 1);
    Renderer renderer(settings);
    Camera camera = lookDownNegativeZ(1.0);
    Scene world;
    world.add(std::make_unique<Sphere>(Point3(0.0, 0.0, -1.0), 0.5,
                                       std::make_shared<Lambertian>(Color(1.0, 1.0, 1.0))));

    // Depth 1 leaves no budget after the first scatter, so a hit is black
    Random rng(99);
    Rgb8 center = renderer.renderPixel(world, camera, 10, 10, rng);
    EXPECT_EQ(center, (Rgb8{{0, 0, 0}}));

    const int corners[4][2] = {{0, 0}, {20, 0}, {0, 20}, {20, 20}};
    for (const auto& corner : corners) {
        Random a(corner[0] * 31 + corner[1]);
        Random b(corner[0] * 31 + corner[1]);
        Rgb8 pixel = renderer.renderPixel(world, camera, corner[0], corner[1], a);
        EXPECT_EQ(pixel, expectedBackground(settings, camera, corner[0], corner[1], b));
        EXPECT_EQ(pixel[2], 255);
    }

    Image image = renderer.render(world, camera);
    EXPECT_EQ(image.getPixel(10, 10), (Rgb8{{0, 0, 0}}));
    EXPECT_EQ(image.getPixel(0, 0)[2], 255);
}

TEST(Renderer, RowsAreFlippedIntoImageOrder) {
    Renderer::Settings settings = quietSettings(6, 5, 2, 4);
    settings.fixedSeed = true;
    settings.seed = 77;
    Renderer renderer(settings);
    Camera camera(Point3(0.0, 0.5, 2.0), Point3(0.0, 0.0, -1.0), Vec3(0.0, 1.0, 0.0), 60.0, 6.0 / 5.0, 0.0, 3.0);
    Scene world = buildDefaultWorld();

    Image image = renderer.render(world, camera);
    for (int j = 0; j < settings.height; ++j) {
        Random rowRng(mixSeed(settings.seed, static_cast<std::uint64_t>(j)));
        std::vector<Rgb8> row = renderer.renderRow(world, camera, j, rowRng);
        ASSERT_EQ(row.size(), 6u);
        for (int i = 0; i < settings.width; ++i) {
            EXPECT_EQ(image.getPixel(i, settings.height - 1 - j), row[i]);
        }
    }
}

TEST(Renderer, FixedSeedIsDeterministicAcrossThreadCounts) {
    Renderer::Settings settings = quietSettings(24, 14, 4, 8);
    settings.fixedSeed = true;
    settings.seed = 2024;
    Scene world = buildDefaultWorld();
    Camera camera(Point3(3.0, 3.0, 2.0), Point3(0.0, 0.0, -1.0), Vec3(0.0, 1.0, 0.0),
                  20.0, 24.0 / 14.0, 2.0, glm::length(Point3(3.0, 3.0, 3.0)));

    settings.threads = 1;
    Image single = Renderer(settings).render(world, camera);
    settings.threads = 4;
    Image parallel = Renderer(settings).render(world, camera);
    Image again = Renderer(settings).render(world, camera);

    EXPECT_EQ(single.pixels, parallel.pixels);
    EXPECT_EQ(parallel.pixels, again.pixels);
}

TEST(Renderer, MoreSamplesConverge) {
    Scene world = buildDefaultWorld();
    Camera camera(Point3(0.0, 0.3, 1.0), Point3(0.0, 0.0, -1.0), Vec3(0.0, 1.0, 0.0), 70.0, 16.0 / 9.0, 0.0, 2.0);

    Image reference = Renderer(quietSettings(16, 9, 800, 6)).render(world, camera);
    Image coarse = Renderer(quietSettings(16, 9, 2, 6)).render(world, camera);
    Image fine = Renderer(quietSettings(16, 9, 200, 6)).render(world, camera);

    double coarseError = meanAbsoluteDifference(coarse, reference);
    double fineError = meanAbsoluteDifference(fine, reference);
    EXPECT_LT(fineError, coarseError);
}
