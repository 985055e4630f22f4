#include "../include/color.hpp"
#include <cmath>

namespace {

// NaN compares false everywhere and falls through to the lower bound.
double clampChannel(double x, double min, double max) {
    if (!(x >= min)) return min;
    if (x > max) return max;
    return x;
}

unsigned char quantize(double channel, double scale) {
    double c = std::sqrt(channel * scale);
    return static_cast<unsigned char>(256.0 * clampChannel(c, 0.0, 0.999));
}

} // namespace

Rgb8 toRgb8(const Color& accumulated, int samplesPerPixel) {
    double scale = 1.0 / samplesPerPixel;
    return Rgb8{
        quantize(accumulated.r, scale),
        quantize(accumulated.g, scale),
        quantize(accumulated.b, scale)
    };
}
