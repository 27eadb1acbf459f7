/**
 * @file crowded_belt.hpp
 * @brief Declaration of the CrowdedBeltCatalog class
 */

#pragma once

#include "astrofield/scenarios/i_project_catalog.hpp"

/**
 * @struct CrowdedBeltConfig
 * @brief Configuration parameters specific to the crowded belt catalog
 */
struct CrowdedBeltConfig {
    // Seeds sit on a rows x columns lattice whose spacing is narrower than
    // a label, so neighbouring colliders start overlapped
    int columns = 3;
    int rows = 2;

    // Normalised lattice placement
    double centerX = 0.5;
    double columnSpacing = 0.18;
    double firstRowY = 0.3;
    double rowSpacing = 0.2;

    // Uniform jitter applied to every lattice point
    double jitterX = 0.03;
    double jitterY = 0.02;

    double minSize = 50.0;
    double maxSize = 90.0;

    unsigned int randomSeed = 7;
};

/**
 * @class CrowdedBeltCatalog
 *
 * Seeds packed closer than their labels allow, so the pre-solve has to
 * push them apart. Useful for watching overlap resolution and wall
 * clamping. A denser lattice can jam in short viewports, where a column
 * of three colliders no longer fits above the depth bias.
 */
class CrowdedBeltCatalog : public IProjectCatalog {
public:
    CrowdedBeltCatalog() = default;
    explicit CrowdedBeltCatalog(const CrowdedBeltConfig &config) : beltConfig(config) {}
    ~CrowdedBeltCatalog() override = default;

    FieldConfig getConfig() const override;
    std::vector<ProjectSeed> getProjects() const override;

private:
    CrowdedBeltConfig beltConfig;
};
