/**
 * @file portfolio_catalog.cpp
 * @brief Implementation of a hand-placed portfolio of six projects.
 *
 * Seeds sit in the upper band of the viewport. Sizes vary between 70 and
 * 110 pixels so the label footprint dominates the collider for the smaller
 * rocks.
 */

#include "astrofield/scenarios/portfolio_catalog.hpp"

#include <utility>

/**
 * @brief Builds one project record
 */
static ProjectSeed makeProject(std::string id,
                               std::string name,
                               std::string tagline,
                               std::vector<std::string> tech,
                               double x, double y, double size,
                               const std::string& color) {
    ProjectSeed p;
    p.id = std::move(id);
    p.name = std::move(name);
    p.tagline = std::move(tagline);
    p.tech = std::move(tech);
    p.asteroid.x = x;
    p.asteroid.y = y;
    p.asteroid.size = size;
    p.asteroid.color = parseAsteroidColor(color);
    return p;
}

FieldConfig PortfolioCatalog::getConfig() const {
    return FieldConfig();
}

std::vector<ProjectSeed> PortfolioCatalog::getProjects() const {
    std::vector<ProjectSeed> projects;

    auto p = makeProject("orbit-tracker", "Orbit Tracker",
                         "Live satellite passes over your horizon",
                         {"C++", "SGP4", "WebSockets"},
                         0.15, 0.20, 100.0, "primary");
    p.description = "Propagates public TLE sets and streams upcoming passes to a small web client.";
    p.links.demo = "https://example.com/orbit-tracker";
    p.links.github = "https://github.com/example/orbit-tracker";
    p.impact = {"Sub-second pass predictions", "Runs on a single Raspberry Pi"};
    projects.push_back(std::move(p));

    p = makeProject("ledger-lite", "Ledger Lite",
                    "Double-entry bookkeeping for tiny teams",
                    {"Rust", "SQLite"},
                    0.38, 0.45, 80.0, "secondary");
    p.description = "A single-binary accounting tool with CSV import and monthly reports.";
    p.links.github = "https://github.com/example/ledger-lite";
    p.impact = {"Used by three local nonprofits"};
    projects.push_back(std::move(p));

    p = makeProject("signal-garden", "Signal Garden",
                    "Generative audio from sensor data",
                    {"C++", "JUCE", "MQTT"},
                    0.62, 0.25, 110.0, "accent");
    p.description = "Turns soil moisture and light readings into an ambient soundscape.";
    p.links.demo = "https://example.com/signal-garden";
    p.impact = {"Installed at a community greenhouse"};
    projects.push_back(std::move(p));

    p = makeProject("hologram-hud", "Hologram HUD",
                    "Sci-fi dashboard toolkit",
                    {"TypeScript", "WebGL"},
                    0.85, 0.40, 90.0, "hologram");
    p.description = "Reusable panels, gauges and scanline effects for status screens.";
    p.links.demo = "https://example.com/hologram-hud";
    p.links.github = "https://github.com/example/hologram-hud";
    projects.push_back(std::move(p));

    p = makeProject("trailhead", "Trailhead",
                    "Offline-first hiking maps",
                    {"Kotlin", "Mapbox"},
                    0.25, 0.70, 70.0, "accent");
    p.description = "Downloads vector tiles per region and records GPX tracks without signal.";
    p.links.github = "https://github.com/example/trailhead";
    p.impact = {"4.7 star rating", "12k installs"};
    projects.push_back(std::move(p));

    p = makeProject("quill", "Quill",
                    "Markdown notes with bidirectional links",
                    {"C++", "Qt"},
                    0.72, 0.65, 75.0, "primary");
    p.description = "Local-first note taking with a graph view of linked pages.";
    projects.push_back(std::move(p));

    return projects;
}
