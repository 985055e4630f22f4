#include "../include/options.hpp"
#include <sstream>
#include <stdexcept>

namespace {

const double kDefaultAspectRatio = 16.0 / 9.0;

int toInt(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(value, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != value.size())
        throw std::invalid_argument("Option " + flag + " expects an integer, got '" + value + "'");
    return result;
}

double toDouble(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != value.size())
        throw std::invalid_argument("Option " + flag + " expects a number, got '" + value + "'");
    return result;
}

std::uint64_t toSeed(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    unsigned long long result = 0;
    try {
        if (!value.empty() && value[0] != '-')
            result = std::stoull(value, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != value.size())
        throw std::invalid_argument("Option " + flag + " expects a non-negative integer, got '" + value + "'");
    return static_cast<std::uint64_t>(result);
}

Vec3 toVec3(const std::string& flag, const std::string& value) {
    std::vector<std::string> fields;
    std::stringstream ss(value);
    std::string field;
    while (std::getline(ss, field, ','))
        fields.push_back(field);
    if (fields.size() != 3)
        throw std::invalid_argument("Option " + flag + " expects x,y,z, got '" + value + "'");
    return Vec3(toDouble(flag, fields[0]), toDouble(flag, fields[1]), toDouble(flag, fields[2]));
}

BlendOptions toBlend(const std::string& flag, const std::string& value) {
    BlendOptions blend;
    size_t colon = value.find_last_of(':');
    if (colon != std::string::npos && colon + 1 < value.size()) {
        std::string tail = value.substr(colon + 1);
        if (tail.find_first_not_of("0123456789.") == std::string::npos) {
            blend.alpha = toDouble(flag, tail);
            blend.path = value.substr(0, colon);
        } else {
            blend.path = value;
        }
    } else {
        blend.path = value;
    }
    if (blend.path.empty())
        throw std::invalid_argument("Option " + flag + " expects path[:alpha]");
    if (blend.alpha < 0.0 || blend.alpha > 1.0)
        throw std::invalid_argument("Option " + flag + " alpha must be in [0, 1], got '" + value + "'");
    return blend;
}

} // namespace

double RenderOptions::aspectRatio() const {
    return static_cast<double>(settings.width) / settings.height;
}

double RenderOptions::effectiveFocusDistance() const {
    return focusDistance > 0.0 ? focusDistance : glm::length(lookFrom - lookAt);
}

RenderOptions parseOptions(int argc, const char* const* argv) {
    RenderOptions options;
    bool heightGiven = false;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];

        if (flag == "--help" || flag == "-h") {
            options.showHelp = true;
            continue;
        }
        if (flag == "--quiet") {
            options.settings.verbose = false;
            continue;
        }

        if (i + 1 >= argc)
            throw std::invalid_argument("Option " + flag + " requires a value");
        std::string value = argv[++i];

        if (flag == "--width") {
            options.settings.width = toInt(flag, value);
        } else if (flag == "--height") {
            options.settings.height = toInt(flag, value);
            heightGiven = true;
        } else if (flag == "--samples") {
            options.settings.samplesPerPixel = toInt(flag, value);
        } else if (flag == "--depth") {
            options.settings.maxDepth = toInt(flag, value);
        } else if (flag == "--threads") {
            options.settings.threads = toInt(flag, value);
        } else if (flag == "--seed") {
            options.settings.seed = toSeed(flag, value);
            options.settings.fixedSeed = true;
        } else if (flag == "--output" || flag == "-o") {
            options.output = value;
        } else if (flag == "--lookfrom") {
            options.lookFrom = toVec3(flag, value);
        } else if (flag == "--lookat") {
            options.lookAt = toVec3(flag, value);
        } else if (flag == "--vup") {
            options.up = toVec3(flag, value);
        } else if (flag == "--vfov") {
            options.verticalFov = toDouble(flag, value);
        } else if (flag == "--aperture") {
            options.aperture = toDouble(flag, value);
        } else if (flag == "--focus-dist") {
            options.focusDistance = toDouble(flag, value);
        } else if (flag == "--blend") {
            options.blend = toBlend(flag, value);
        } else if (flag == "--set-pixel") {
            options.pixelEdits.push_back(parsePixelEdit(value));
        } else {
            throw std::invalid_argument("Unknown option " + flag);
        }
    }

    if (!heightGiven)
        options.settings.height = static_cast<int>(options.settings.width / kDefaultAspectRatio);

    const Renderer::Settings& s = options.settings;
    if (s.width < 2 || s.height < 2)
        throw std::invalid_argument("Image must be at least 2x2, got " +
                                    std::to_string(s.width) + "x" + std::to_string(s.height));
    if (s.samplesPerPixel < 1)
        throw std::invalid_argument("--samples must be at least 1");
    if (s.maxDepth < 1)
        throw std::invalid_argument("--depth must be at least 1");
    if (s.threads < 0)
        throw std::invalid_argument("--threads must not be negative");
    if (!(options.verticalFov > 0.0 && options.verticalFov < 180.0))
        throw std::invalid_argument("--vfov must be in (0, 180) degrees");
    if (options.aperture < 0.0)
        throw std::invalid_argument("--aperture must not be negative");

    return options;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "  --width N             image width in pixels (default 400)\n"
        << "  --height N            image height (default width / (16/9))\n"
        << "  --samples N           samples per pixel (default 100)\n"
        << "  --depth N             maximum bounces per path (default 10)\n"
        << "  --threads N           worker threads, 0 = all cores (default 0)\n"
        << "  --seed N              fixed seed for reproducible renders\n"
        << "  -o, --output PATH     .png, .ppm, .jpg or .bmp (default render.png)\n"
        << "  --lookfrom x,y,z      camera position (default 3,3,2)\n"
        << "  --lookat x,y,z        camera target (default 0,0,-1)\n"
        << "  --vup x,y,z           camera up vector (default 0,1,0)\n"
        << "  --vfov DEG            vertical field of view (default 20)\n"
        << "  --aperture A          lens aperture, 0 = pinhole (default 2.0)\n"
        << "  --focus-dist D        focus distance (default |lookfrom - lookat|)\n"
        << "  --blend PATH[:ALPHA]  blend the render with an image (default alpha 0.5)\n"
        << "  --set-pixel x,y=r,g,b override one output pixel, repeatable\n"
        << "  --quiet               no progress output\n"
        << "  -h, --help            show this message\n";
    return out.str();
}
