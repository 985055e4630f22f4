#pragma once

#include <cstdint>
#include <random>

// Per-worker random source. Instances are never shared between threads.
class Random {
public:
    explicit Random(std::uint64_t seed = std::random_device{}());

    // Uniform in [0, 1).
    double uniform();

    // Uniform in [min, max).
    double uniform(double min, double max);

private:
    std::mt19937_64 gen;
    std::uniform_real_distribution<double> distribution;
};

// Derives a decorrelated seed for stream `stream` from a base seed.
std::uint64_t mixSeed(std::uint64_t base, std::uint64_t stream);
