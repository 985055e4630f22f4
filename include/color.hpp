#pragma once

#include <array>
#include "math/vec_math.hpp"

using Rgb8 = std::array<unsigned char, 3>;

// Averages an accumulated sample sum, applies gamma 2 and quantizes to 8 bits.
Rgb8 toRgb8(const Color& accumulated, int samplesPerPixel);
