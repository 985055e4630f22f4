#include "../include/math/random.hpp"

Random::Random(std::uint64_t seed)
    : gen(seed)
    , distribution(0.0, 1.0) {}

double Random::uniform() {
    double r = distribution(gen);
    // generate_canonical may round up to 1.0 on some standard libraries
    return r < 1.0 ? r : 0.0;
}

double Random::uniform(double min, double max) {
    return min + (max - min) * uniform();
}

std::uint64_t mixSeed(std::uint64_t base, std::uint64_t stream) {
    std::uint64_t z = base + 0x9E3779B97F4A7C15ULL * (stream + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}
