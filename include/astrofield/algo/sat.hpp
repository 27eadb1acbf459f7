/**
 * @file sat.hpp
 * @brief Separating-axis test between two convex polygons
 */

#ifndef ASTROFIELD_SAT_HPP
#define ASTROFIELD_SAT_HPP

#include <optional>
#include "astrofield/math/polygon.hpp"

/**
 * @brief Minimum translation vector between two overlapping polygons
 *
 * normal is unit length and points from A's vertex centroid towards B's, so
 * moving A by -normal*overlap/2 and B by +normal*overlap/2 separates them.
 */
struct Mtv {
    Vector normal;
    double overlap;
};

/**
 * @brief Tests two convex polygons for overlap on every edge normal of both
 *
 * Stops at the first axis with zero or negative overlap. Touching polygons
 * are therefore reported as separated.
 *
 * @param A First convex polygon (world space, at least one vertex)
 * @param B Second convex polygon (world space, at least one vertex)
 * @return The axis of least overlap, or std::nullopt when separated
 */
std::optional<Mtv> satCollide(const Polygon &A, const Polygon &B);

#endif
