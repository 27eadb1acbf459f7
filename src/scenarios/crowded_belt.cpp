/**
 * @file crowded_belt.cpp
 * @brief Implementation of a catalog whose seeds start heavily overlapped.
 */

#include "astrofield/scenarios/crowded_belt.hpp"

#include <random>
#include <string>
#include <utility>

FieldConfig CrowdedBeltCatalog::getConfig() const {
    FieldConfig cfg;
    cfg.debugColliders = true;
    return cfg;
}

std::vector<ProjectSeed> CrowdedBeltCatalog::getProjects() const {
    std::default_random_engine generator(beltConfig.randomSeed);
    std::uniform_real_distribution<double> jitterX(-beltConfig.jitterX, beltConfig.jitterX);
    std::uniform_real_distribution<double> jitterY(-beltConfig.jitterY, beltConfig.jitterY);
    std::uniform_real_distribution<double> distSize(beltConfig.minSize, beltConfig.maxSize);

    static const AsteroidColor palette[] = {
        AsteroidColor::Primary, AsteroidColor::Secondary,
        AsteroidColor::Accent, AsteroidColor::Hologram
    };

    double const firstColumnX = beltConfig.centerX
                              - 0.5 * (beltConfig.columns - 1) * beltConfig.columnSpacing;

    std::vector<ProjectSeed> projects;
    projects.reserve(static_cast<size_t>(beltConfig.rows * beltConfig.columns));
    for (int row = 0; row < beltConfig.rows; ++row) {
        for (int col = 0; col < beltConfig.columns; ++col) {
            int const i = row * beltConfig.columns + col;

            ProjectSeed p;
            p.id = "rock-" + std::to_string(i);
            p.name = "Rock " + std::to_string(i + 1);
            p.tagline = "Belt object #" + std::to_string(i + 1);
            p.asteroid.x = firstColumnX + col * beltConfig.columnSpacing + jitterX(generator);
            p.asteroid.y = beltConfig.firstRowY + row * beltConfig.rowSpacing + jitterY(generator);
            p.asteroid.size = distSize(generator);
            p.asteroid.color = palette[i % 4];
            projects.push_back(std::move(p));
        }
    }
    return projects;
}
