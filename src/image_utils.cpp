#include "../include/utils/image_utils.hpp"
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string lowercaseExtension(const std::string& filename) {
    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos || filename.find_first_of("/\\", dot) != std::string::npos)
        return "";
    std::string ext = filename.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

int parseInt(const std::string& field, const std::string& text) {
    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(field, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid pixel edit '" + text + "': '" + field + "' is not an integer");
    }
    if (pos != field.size())
        throw std::invalid_argument("Invalid pixel edit '" + text + "': '" + field + "' is not an integer");
    return value;
}

std::vector<std::string> splitFields(const std::string& s, char sep) {
    std::vector<std::string> fields;
    std::stringstream ss(s);
    std::string field;
    while (std::getline(ss, field, sep))
        fields.push_back(field);
    if (!s.empty() && s.back() == sep)
        fields.push_back("");
    return fields;
}

} // namespace

void savePpm(const std::string& filename, const Image& image) {
    std::ofstream file(filename, std::ios::binary);
    if (!file)
        throw std::runtime_error("Cannot open '" + filename + "' for writing");
    file << "P6\n" << image.width << " " << image.height << "\n255\n";
    file.write(reinterpret_cast<const char*>(image.pixels.data()),
               static_cast<std::streamsize>(image.pixels.size()));
    if (!file)
        throw std::runtime_error("Failed to write '" + filename + "'");
}

void saveImage(const std::string& filename, const Image& image) {
    std::string ext = lowercaseExtension(filename);
    int ok = 0;
    if (ext == ".ppm") {
        savePpm(filename, image);
        ok = 1;
    } else if (ext == ".png") {
        ok = stbi_write_png(filename.c_str(), image.width, image.height, 3,
                            image.pixels.data(), image.width * 3);
    } else if (ext == ".jpg" || ext == ".jpeg") {
        ok = stbi_write_jpg(filename.c_str(), image.width, image.height, 3,
                            image.pixels.data(), 95);
    } else if (ext == ".bmp") {
        ok = stbi_write_bmp(filename.c_str(), image.width, image.height, 3,
                            image.pixels.data());
    } else {
        throw std::invalid_argument("Unsupported output format '" + filename +
                                    "' (expected .png, .ppm, .jpg or .bmp)");
    }

    if (!ok)
        throw std::runtime_error("Failed to write '" + filename + "'");
    std::cout << "Image saved as: " << filename << std::endl;
}

Image loadImage(const std::string& filename) {
    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load(filename.c_str(), &width, &height, &channels, 3);
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error("Cannot load image '" + filename + "': " +
                                 (reason ? reason : "unknown error"));
    }

    Image image(width, height);
    std::copy(data, data + static_cast<size_t>(width) * height * 3, image.pixels.begin());
    stbi_image_free(data);
    return image;
}

Image resizeImage(const Image& image, int width, int height) {
    if (width <= 0 || height <= 0)
        throw std::invalid_argument("Resize target must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    if (image.width <= 0 || image.height <= 0)
        throw std::invalid_argument("Cannot resize an empty image");

    Image out(width, height);
    double sx = static_cast<double>(image.width) / width;
    double sy = static_cast<double>(image.height) / height;

    for (int y = 0; y < height; ++y) {
        // Sample at pixel centers
        double fy = std::min(std::max((y + 0.5) * sy - 0.5, 0.0), image.height - 1.0);
        int y0 = static_cast<int>(fy);
        int y1 = std::min(y0 + 1, image.height - 1);
        double ty = fy - y0;

        for (int x = 0; x < width; ++x) {
            double fx = std::min(std::max((x + 0.5) * sx - 0.5, 0.0), image.width - 1.0);
            int x0 = static_cast<int>(fx);
            int x1 = std::min(x0 + 1, image.width - 1);
            double tx = fx - x0;

            Rgb8 p00 = image.getPixel(x0, y0);
            Rgb8 p10 = image.getPixel(x1, y0);
            Rgb8 p01 = image.getPixel(x0, y1);
            Rgb8 p11 = image.getPixel(x1, y1);

            Rgb8 result;
            for (int c = 0; c < 3; ++c) {
                double top = p00[c] + (p10[c] - p00[c]) * tx;
                double bottom = p01[c] + (p11[c] - p01[c]) * tx;
                double value = top + (bottom - top) * ty;
                result[c] = static_cast<unsigned char>(std::lround(std::min(std::max(value, 0.0), 255.0)));
            }
            out.setPixel(x, y, result);
        }
    }
    return out;
}

void blendImages(Image& base, const Image& overlay, double alpha) {
    if (!(alpha >= 0.0 && alpha <= 1.0))
        throw std::invalid_argument("Blend factor must be in [0, 1], got " + std::to_string(alpha));
    if (base.width != overlay.width || base.height != overlay.height)
        throw std::invalid_argument("Cannot blend a " + std::to_string(overlay.width) + "x" +
                                    std::to_string(overlay.height) + " image onto a " +
                                    std::to_string(base.width) + "x" + std::to_string(base.height) +
                                    " image");

    for (size_t i = 0; i < base.pixels.size(); ++i) {
        double value = (1.0 - alpha) * base.pixels[i] + alpha * overlay.pixels[i];
        base.pixels[i] = static_cast<unsigned char>(std::lround(value));
    }
}

PixelEdit parsePixelEdit(const std::string& text) {
    size_t eq = text.find('=');
    if (eq == std::string::npos)
        throw std::invalid_argument("Invalid pixel edit '" + text + "': expected x,y=r,g,b");

    std::vector<std::string> coords = splitFields(text.substr(0, eq), ',');
    std::vector<std::string> channels = splitFields(text.substr(eq + 1), ',');
    if (coords.size() != 2 || channels.size() != 3)
        throw std::invalid_argument("Invalid pixel edit '" + text + "': expected x,y=r,g,b");

    PixelEdit edit;
    edit.x = parseInt(coords[0], text);
    edit.y = parseInt(coords[1], text);
    for (int c = 0; c < 3; ++c) {
        int value = parseInt(channels[c], text);
        if (value < 0 || value > 255)
            throw std::invalid_argument("Invalid pixel edit '" + text + "': channel " +
                                        std::to_string(value) + " is outside [0, 255]");
        edit.rgb[c] = static_cast<unsigned char>(value);
    }
    return edit;
}

void applyPixelEdits(Image& image, const std::vector<PixelEdit>& edits) {
    for (const auto& edit : edits) {
        image.setPixel(edit.x, edit.y, edit.rgb);
    }
}
