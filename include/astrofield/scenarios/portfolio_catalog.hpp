/**
 * @file portfolio_catalog.hpp
 * @brief Declaration of the PortfolioCatalog class
 */

#pragma once

#include "astrofield/scenarios/i_project_catalog.hpp"

/**
 * @class PortfolioCatalog
 *
 * A hand-placed set of six projects spread across the upper band of the
 * viewport, one per palette colour plus repeats.
 */
class PortfolioCatalog : public IProjectCatalog {
public:
    PortfolioCatalog() = default;
    ~PortfolioCatalog() override = default;

    FieldConfig getConfig() const override;
    std::vector<ProjectSeed> getProjects() const override;
};
