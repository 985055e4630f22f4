#include "../include/world.hpp"
#include "../include/material.hpp"
#include "../include/sphere.hpp"
#include <memory>

Scene buildDefaultWorld() {
    Scene world;

    auto materialGround = std::make_shared<Lambertian>(Color(0.8, 0.8, 0.0));
    auto materialCenter = std::make_shared<Lambertian>(Color(0.1, 0.2, 0.5));
    auto materialLeft = std::make_shared<Dielectric>(1.5);
    auto materialRight = std::make_shared<Metal>(Color(0.8, 0.6, 0.2), 0.0);

    world.add(std::make_unique<Sphere>(Point3(0.0, -100.5, -1.0), 100.0, materialGround));
    world.add(std::make_unique<Sphere>(Point3(0.0, 0.0, -1.0), 0.5, materialCenter));
    // Outer and inner wall of the glass bubble share one material
    world.add(std::make_unique<Sphere>(Point3(-1.0, 0.0, -1.0), 0.5, materialLeft));
    world.add(std::make_unique<Sphere>(Point3(-1.0, 0.0, -1.0), -0.45, materialLeft));
    world.add(std::make_unique<Sphere>(Point3(1.0, 0.0, -1.0), 0.5, materialRight));

    return world;
}
