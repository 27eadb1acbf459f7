/**
 * @file project_seed.hpp
 * @brief Immutable project records that seed one asteroid each
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Palette entries an asteroid can be tinted with
 */
enum class AsteroidColor {
    Primary,
    Secondary,
    Accent,
    Hologram
};

/**
 * @brief RGB triple for a palette entry
 */
struct PaletteRgb {
    unsigned char r, g, b;
};

/**
 * @brief Parses a palette name; unknown names fall back to Primary
 */
AsteroidColor parseAsteroidColor(const std::string &name);

/** @brief Canonical lower-case name of a palette entry */
std::string asteroidColorName(AsteroidColor color);

/** @brief Display colour of a palette entry */
PaletteRgb paletteRgb(AsteroidColor color);

struct ProjectLinks {
    std::optional<std::string> demo;
    std::optional<std::string> github;
};

/**
 * @brief Normalised placement of the asteroid for a project
 */
struct AsteroidSeed {
    double x = 0.5;      ///< Horizontal viewport fraction in [0,1]
    double y = 0.5;      ///< Vertical viewport fraction in [0,1]
    double size = 80.0;  ///< Diameter in pixels
    AsteroidColor color = AsteroidColor::Primary;
};

/**
 * @brief One project record as supplied by the project list
 */
struct ProjectSeed {
    std::string id;
    std::string name;
    std::string tagline;
    std::string description;
    std::vector<std::string> tech;
    ProjectLinks links;
    std::vector<std::string> impact;
    AsteroidSeed asteroid;
};

/**
 * @brief Returns true if the link is present and not blank
 */
bool hasLink(const std::optional<std::string> &href);

/**
 * @brief Filters a project list down to seeds the field can place
 *
 * Problems are reported on std::cerr and never abort:
 * - x and y outside [0,1] are clamped
 * - size <= 0 or an empty id drops the record
 * - a repeated id drops the later record
 *
 * @param seeds Project list in display order
 * @return Accepted seeds, original order preserved
 */
std::vector<ProjectSeed> sanitizeSeeds(const std::vector<ProjectSeed> &seeds);
