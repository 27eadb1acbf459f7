/**
 * @file field_renderer.hpp
 * @brief Asteroid field rendering using SFML
 *
 * This renderer handles:
 * - Shaded, cratered asteroid polygons with a glow on the hovered body
 * - Name and tagline labels at the simulator's label anchors
 * - Optional merged-collider overlay for debugging
 * - A status line (FPS, selected project)
 *
 * It only reads FieldSnapshot values; it never touches the registry.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <SFML/Graphics.hpp>

#include "astrofield/core/project_seed.hpp"
#include "astrofield/core/snapshot.hpp"

/**
 * @brief Converts a palette entry to an SFML colour
 */
sf::Color toSfColor(AsteroidColor color, sf::Uint8 alpha = 255);

/**
 * @class FieldRenderer
 * @brief Owns the SFML window and draws field snapshots into it
 */
class FieldRenderer {
public:
    FieldRenderer(unsigned int width, unsigned int height, std::string fontPath);
    ~FieldRenderer() = default;

    /**
     * @brief Creates the SFML window and loads the label font
     * @return true if success, false otherwise
     */
    bool init();

    /** Clears the screen to the space background */
    void clear();

    /** Presents the rendered frame to display */
    void present();

    /**
     * @brief Matches the view to a new window size so one unit stays one pixel
     */
    void resize(unsigned int width, unsigned int height);

    /**
     * @brief Draws every body of the snapshot, then the labels if visible
     * @param snapshot Current field state
     * @param projects Project list indexed by BodySnapshot::seedIndex
     */
    void renderField(const FieldSnapshot& snapshot, const std::vector<ProjectSeed>& projects);

    void renderFPS(float fps);

    /**
     * @brief Draws the selected project's name and links along the bottom edge
     */
    void renderSelection(const ProjectSeed* project);

    sf::RenderWindow& getWindow() { return window; }

private:
    void renderAsteroid(const BodySnapshot& body);
    void renderCollider(const Polygon& collider);
    void renderLabel(const BodySnapshot& body, const ProjectSeed& project, const Components::LabelLayout& layout);
    void renderText(const std::string& text, float x, float y, unsigned int size, sf::Color color);

    sf::RenderWindow window;
    sf::Font font;

    unsigned int screenWidth;
    unsigned int screenHeight;
    std::string fontPath;
};
