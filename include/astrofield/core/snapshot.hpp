/**
 * @file snapshot.hpp
 * @brief Read-only view of the field handed to renderers each frame
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "astrofield/components/field.hpp"
#include "astrofield/core/project_seed.hpp"
#include "astrofield/math/polygon.hpp"

/**
 * @brief Everything needed to draw one asteroid and place its label
 */
struct BodySnapshot {
    std::string projectId;
    std::size_t seedIndex = 0;
    Position position;
    double rotationDegrees = 0.0;
    double radius = 0.0;
    double size = 0.0;
    AsteroidColor color = AsteroidColor::Primary;
    bool hovered = false;

    Polygon localSilhouette;    ///< For drawing with a translate/rotate transform
    Polygon worldSilhouette;

    /// Top-centre of the label text block; the overlay centres itself on x
    Position labelAnchor;

    /// Merged collider, only filled when debug colliders are enabled
    std::optional<Polygon> collider;
};

struct FieldSnapshot {
    double width = 0.0;
    double height = 0.0;
    Components::LifecyclePhase phase = Components::LifecyclePhase::Uninitialized;
    Components::LabelLayout label;
    bool labelsVisible = false;
    std::optional<std::string> hoveredId;
    std::vector<BodySnapshot> bodies;
};
