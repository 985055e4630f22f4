#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "color.hpp"

// RGB8 pixels, row-major, top row first.
struct Image {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels;

    Image() = default;
    Image(int w, int h)
        : width(w), height(h), pixels(static_cast<size_t>(w) * h * 3, 0) {}

    bool contains(int x, int y) const {
        return x >= 0 && x < width && y >= 0 && y < height;
    }

    Rgb8 getPixel(int x, int y) const {
        size_t i = index(x, y);
        return Rgb8{pixels[i], pixels[i + 1], pixels[i + 2]};
    }

    void setPixel(int x, int y, const Rgb8& rgb) {
        size_t i = index(x, y);
        pixels[i + 0] = rgb[0];
        pixels[i + 1] = rgb[1];
        pixels[i + 2] = rgb[2];
    }

private:
    size_t index(int x, int y) const {
        if (!contains(x, y)) {
            throw std::out_of_range("Pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                                    ") is outside the " + std::to_string(width) + "x" +
                                    std::to_string(height) + " image");
        }
        return (static_cast<size_t>(y) * width + x) * 3;
    }
};
