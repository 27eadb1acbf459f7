/**
 * @file collider_builder.hpp
 * @brief Builds the single convex collider covering an asteroid and its label
 *
 * The label is laid out as an axis-aligned rectangle centred under the body.
 * The collider is the convex hull of the rotated silhouette and the label's
 * four corners, so neither the rock nor its caption can overlap a neighbour.
 * Colliders are recomputed from the current pose on every query.
 */

#ifndef ASTROFIELD_COLLIDER_BUILDER_HPP
#define ASTROFIELD_COLLIDER_BUILDER_HPP

#include <array>

#include "astrofield/components/basic.hpp"
#include "astrofield/components/field.hpp"
#include "astrofield/math/polygon.hpp"

namespace Collision {

/**
 * @brief Axis-aligned label rectangle in viewport pixels
 */
struct LabelRect {
    double x;   ///< Left edge
    double y;   ///< Top edge
    double w;
    double h;

    /** @brief Corners clockwise on screen, starting top-left */
    std::array<Vector, 4> corners() const;
};

/**
 * @brief Label layout for a viewport width
 *
 * @param viewportWidth Frame width in pixels
 * @param breakpoint Widths at or above this use the desktop label size
 * @param desktop Label used on wide viewports
 * @param compact Label used below the breakpoint
 */
Components::LabelLayout labelLayoutFor(double viewportWidth,
                                       double breakpoint,
                                       const Components::LabelLayout &desktop,
                                       const Components::LabelLayout &compact);

/**
 * @brief Label rectangle anchored at (x - w/2, y + radius + gap)
 */
LabelRect labelRect(const Components::Position &pos, double radius, const Components::LabelLayout &layout);

/**
 * @brief Silhouette rotated by the body's rotation and moved to its position
 */
Polygon worldSilhouette(const Components::Silhouette &silhouette,
                        const Components::Position &pos,
                        double rotationDegrees);

/**
 * @brief Convex hull of the world silhouette and the label corners
 */
Polygon mergedCollider(const Components::Silhouette &silhouette,
                       const Components::Position &pos,
                       double rotationDegrees,
                       double radius,
                       const Components::LabelLayout &layout);

} // namespace Collision

#endif // ASTROFIELD_COLLIDER_BUILDER_HPP
