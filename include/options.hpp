#pragma once

#include <optional>
#include <string>
#include <vector>
#include "renderer.hpp"
#include "utils/image_utils.hpp"

struct BlendOptions {
    std::string path;
    double alpha = 0.5;
};

struct RenderOptions {
    Renderer::Settings settings;

    Point3 lookFrom = Point3(3.0, 3.0, 2.0);
    Point3 lookAt = Point3(0.0, 0.0, -1.0);
    Vec3 up = Vec3(0.0, 1.0, 0.0);
    double verticalFov = 20.0;
    double aperture = 2.0;
    double focusDistance = 0.0;       // <= 0 focuses on lookAt

    std::string output = "render.png";
    std::optional<BlendOptions> blend;
    std::vector<PixelEdit> pixelEdits;
    bool showHelp = false;

    double aspectRatio() const;
    double effectiveFocusDistance() const;
};

// Throws std::invalid_argument describing the first bad argument.
RenderOptions parseOptions(int argc, const char* const* argv);

std::string usage(const std::string& program);
