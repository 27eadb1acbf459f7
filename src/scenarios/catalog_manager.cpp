/**
 * @fileoverview catalog_manager.cpp
 * @brief Implementation of CatalogManager.
 */

#include "astrofield/scenarios/catalog_manager.hpp"

#include "astrofield/scenarios/crowded_belt.hpp"
#include "astrofield/scenarios/portfolio_catalog.hpp"

CatalogManager::CatalogManager() {
    catalogList.emplace_back(CatalogType::PORTFOLIO, "portfolio");
    catalogList.emplace_back(CatalogType::CROWDED_BELT, "crowded");
}

const std::vector<std::pair<CatalogType, std::string>>&
CatalogManager::getCatalogList() const {
    return catalogList;
}

bool CatalogManager::findByName(const std::string& name, CatalogType& type) const {
    for (const auto& entry : catalogList) {
        if (entry.second == name) {
            type = entry.first;
            return true;
        }
    }
    return false;
}

std::unique_ptr<IProjectCatalog> CatalogManager::createCatalog(CatalogType type) const {
    switch (type) {
        case CatalogType::CROWDED_BELT:
            return std::make_unique<CrowdedBeltCatalog>();

        case CatalogType::PORTFOLIO:
        default:
            return std::make_unique<PortfolioCatalog>();
    }
}
