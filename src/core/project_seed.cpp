#include "astrofield/core/project_seed.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_set>

AsteroidColor parseAsteroidColor(const std::string &name) {
    if (name == "primary") {
        return AsteroidColor::Primary;
    }
    if (name == "secondary") {
        return AsteroidColor::Secondary;
    }
    if (name == "accent") {
        return AsteroidColor::Accent;
    }
    if (name == "hologram") {
        return AsteroidColor::Hologram;
    }
    return AsteroidColor::Primary;
}

std::string asteroidColorName(AsteroidColor color) {
    switch (color) {
        case AsteroidColor::Primary:   return "primary";
        case AsteroidColor::Secondary: return "secondary";
        case AsteroidColor::Accent:    return "accent";
        case AsteroidColor::Hologram:  return "hologram";
        default: return "primary";
    }
}

PaletteRgb paletteRgb(AsteroidColor color) {
    // hsl(185,100%,50%), hsl(270,60%,50%), hsl(25,100%,55%), hsl(185,100%,70%)
    switch (color) {
        case AsteroidColor::Secondary: return {128, 51, 204};
        case AsteroidColor::Accent:    return {255, 121, 26};
        case AsteroidColor::Hologram:  return {102, 242, 255};
        case AsteroidColor::Primary:
        default:                       return {0, 234, 255};
    }
}

bool hasLink(const std::optional<std::string> &href) {
    if (!href) {
        return false;
    }
    return std::any_of(href->begin(), href->end(), [](char c) {
        return c != ' ' && c != '\t' && c != '\n' && c != '\r';
    });
}

std::vector<ProjectSeed> sanitizeSeeds(const std::vector<ProjectSeed> &seeds) {
    std::vector<ProjectSeed> accepted;
    accepted.reserve(seeds.size());
    std::unordered_set<std::string> seen;

    for (const auto &seed : seeds) {
        if (seed.id.empty()) {
            std::cerr << "[Seeds] Skipping project \"" << seed.name << "\": empty id" << std::endl;
            continue;
        }
        if (!(seed.asteroid.size > 0.0)) {
            std::cerr << "[Seeds] Skipping project " << seed.id
                      << ": asteroid size " << seed.asteroid.size << " is not positive" << std::endl;
            continue;
        }
        if (!seen.insert(seed.id).second) {
            std::cerr << "[Seeds] Skipping project " << seed.id << ": duplicate id" << std::endl;
            continue;
        }

        ProjectSeed copy = seed;
        double const cx = std::clamp(seed.asteroid.x, 0.0, 1.0);
        double const cy = std::clamp(seed.asteroid.y, 0.0, 1.0);
        if (cx != seed.asteroid.x || cy != seed.asteroid.y) {
            std::cerr << "[Seeds] Project " << seed.id << ": position ("
                      << seed.asteroid.x << ", " << seed.asteroid.y
                      << ") clamped into [0,1]" << std::endl;
        }
        copy.asteroid.x = cx;
        copy.asteroid.y = cy;
        accepted.push_back(std::move(copy));
    }
    return accepted;
}
