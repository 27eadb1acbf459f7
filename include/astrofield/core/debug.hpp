#pragma once

#include <algorithm>
#include <iostream>

// Set to 1 (or define at build time) to enable debug output
#ifndef ASTROFIELD_ENABLE_DEBUG
#define ASTROFIELD_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (ASTROFIELD_ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Counters describing how hard the solver is working
class DebugStats {
public:
    static void reset() {
        contacts = 0;
        wall_clamps = 0;
        max_speed = 0.0;
        frames = 0;
    }

    static void recordContacts(int count) {
        contacts += count;
    }

    static void recordWallClamp() {
        wall_clamps++;
    }

    static void recordSpeed(double speed) {
        max_speed = std::max(max_speed, speed);
    }

    static void recordFrame() {
        frames++;
    }

    static long contactCount() { return contacts; }
    static long wallClampCount() { return wall_clamps; }
    static long frameCount() { return frames; }
    static double maxSpeed() { return max_speed; }

    static void printStats() {
        std::cout << "Field stats over " << frames << " frames:\n"
                  << "  Pair corrections: " << contacts << "\n"
                  << "  Wall clamps: " << wall_clamps << "\n"
                  << "  Max drift: " << max_speed << " pixels/frame\n";
    }

private:
    static long contacts;
    static long wall_clamps;
    static double max_speed;
    static long frames;
};
