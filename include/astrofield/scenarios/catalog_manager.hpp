/**
 * @fileoverview catalog_manager.hpp
 * @brief Keeps the list of available project catalogs and creates them by name.
 */

#ifndef ASTROFIELD_CATALOG_MANAGER_HPP
#define ASTROFIELD_CATALOG_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "astrofield/scenarios/i_project_catalog.hpp"

enum class CatalogType {
    PORTFOLIO,
    CROWDED_BELT
};

/**
 * @class CatalogManager
 * @brief Catalog of available project lists and a factory to create them.
 */
class CatalogManager {
public:
    CatalogManager();

    /**
     * @brief Returns the (type, name) list of every available catalog.
     */
    const std::vector<std::pair<CatalogType, std::string>>& getCatalogList() const;

    /**
     * @brief Looks up a catalog by its command-line name.
     * @return true and sets @p type if the name is known.
     */
    bool findByName(const std::string& name, CatalogType& type) const;

    /**
     * @brief Creates a new catalog object of the specified type.
     */
    std::unique_ptr<IProjectCatalog> createCatalog(CatalogType type) const;

private:
    std::vector<std::pair<CatalogType, std::string>> catalogList;
};

#endif // ASTROFIELD_CATALOG_MANAGER_HPP
