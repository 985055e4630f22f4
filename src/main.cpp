#include <iostream>
#include <string>
#include "../include/camera.hpp"
#include "../include/options.hpp"
#include "../include/renderer.hpp"
#include "../include/utils/image_utils.hpp"
#include "../include/world.hpp"

int main(int argc, char** argv) {
    try {
        RenderOptions options = parseOptions(argc, argv);
        if (options.showHelp) {
            std::cout << usage(argv[0]);
            return 0;
        }
        const bool verbose = options.settings.verbose;

        if (verbose)
            std::cout << "Building world..." << std::endl;
        Scene world = buildDefaultWorld();

        Camera camera(
            options.lookFrom,
            options.lookAt,
            options.up,
            options.verticalFov,
            options.aspectRatio(),
            options.aperture,
            options.effectiveFocusDistance()
        );

        Renderer renderer(options.settings);
        Image image = renderer.render(world, camera);

        if (options.blend) {
            if (verbose)
                std::cout << "Blending with " << options.blend->path
                          << " (alpha " << options.blend->alpha << ")" << std::endl;
            Image reference = loadImage(options.blend->path);
            if (reference.width != image.width || reference.height != image.height) {
                reference = resizeImage(reference, image.width, image.height);
            }
            blendImages(image, reference, options.blend->alpha);
        }

        applyPixelEdits(image, options.pixelEdits);

        saveImage(options.output, image);
        std::cout << "Wrote " << options.output << " (" << image.width << "x" << image.height << ")" << std::endl;
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
