#ifndef ASTROFIELD_I_PROJECT_CATALOG_HPP
#define ASTROFIELD_I_PROJECT_CATALOG_HPP

#include <string>
#include <vector>

#include "astrofield/core/field_config.hpp"
#include "astrofield/core/project_seed.hpp"

/**
 * @brief Abstract source of the projects shown in one asteroid field
 *
 * Each catalog must provide:
 *  - getConfig() returning the FieldConfig it is tuned for
 *  - getProjects() returning its seeds in display order
 */
class IProjectCatalog {
public:
    virtual ~IProjectCatalog() = default;

    /**
     * @brief Field configuration the catalog is meant to be shown with
     */
    virtual FieldConfig getConfig() const = 0;

    /**
     * @brief Project seeds in display (and pair-resolution) order
     */
    virtual std::vector<ProjectSeed> getProjects() const = 0;
};

#endif // ASTROFIELD_I_PROJECT_CATALOG_HPP
