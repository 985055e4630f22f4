#pragma once

#include <string>
#include <vector>
#include "../image.hpp"

struct PixelEdit {
    int x = 0;
    int y = 0;
    Rgb8 rgb{{0, 0, 0}};
};

// Binary PPM (P6) writer
void savePpm(const std::string& filename, const Image& image);

// Picks the encoder from the extension: .ppm, .png, .jpg/.jpeg or .bmp
void saveImage(const std::string& filename, const Image& image);

// Decodes any format stb understands into 3-channel RGB
Image loadImage(const std::string& filename);

// Bilinear resampling
Image resizeImage(const Image& image, int width, int height);

// Per channel (1 - alpha) * base + alpha * overlay, rounded. Sizes must match.
void blendImages(Image& base, const Image& overlay, double alpha);

// Parses "x,y=r,g,b"
PixelEdit parsePixelEdit(const std::string& text);

void applyPixelEdits(Image& image, const std::vector<PixelEdit>& edits);
