/**
 * @fileoverview main.cpp
 * @brief Entry point of the asteroid field demo.
 *
 * Usage: astrofield_demo [--catalog portfolio|crowded] [--font path.ttf]
 *                        [--size WxH] [--reduced-motion] [--debug-colliders]
 *                        [--stats]
 */

#include <cstdio>
#include <iostream>
#include <string>

#include "astrofield/app/demo_manager.hpp"
#include "astrofield/core/profile.hpp"

static void printUsage() {
    std::cout << "Usage: astrofield_demo [--catalog portfolio|crowded] [--font path.ttf]\n"
              << "                       [--size WxH] [--reduced-motion] [--debug-colliders] [--stats]\n";
}

int main(int argc, char** argv) {
    DemoOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string const arg = argv[i];
        if (arg == "--catalog" && i + 1 < argc) {
            options.catalogName = argv[++i];
        } else if (arg == "--font" && i + 1 < argc) {
            options.fontPath = argv[++i];
        } else if (arg == "--size" && i + 1 < argc) {
            unsigned int w = 0;
            unsigned int h = 0;
            if (std::sscanf(argv[++i], "%ux%u", &w, &h) != 2 || w == 0 || h == 0) {
                std::cerr << "Invalid --size, expected WxH" << std::endl;
                return 1;
            }
            options.width = w;
            options.height = h;
        } else if (arg == "--reduced-motion") {
            options.reducedMotion = true;
        } else if (arg == "--debug-colliders") {
            options.debugColliders = true;
        } else if (arg == "--stats") {
            options.printStats = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown argument " << arg << std::endl;
            printUsage();
            return 1;
        }
    }

    DemoManager demo(options);
    if (!demo.init()) {
        return 1;
    }

    {
        PROFILE_SCOPE("main");
        demo.run();
    }
    return 0;
}
