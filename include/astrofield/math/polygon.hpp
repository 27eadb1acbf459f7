/**
 * @file polygon.hpp
 * @brief Convex polygon primitives used by the collision pipeline
 *
 * This file provides:
 * - The Polygon vertex list type shared by silhouettes and colliders
 * - Local-to-world transformation (rotation then translation)
 * - Projection of a polygon onto an axis
 * - Monotone-chain convex hull construction
 */

#ifndef ASTROFIELD_POLYGON_HPP
#define ASTROFIELD_POLYGON_HPP

#include <vector>
#include "astrofield/math/vector_math.hpp"

/**
 * @brief Ordered vertex list; local space for silhouettes, world space for colliders
 */
using Polygon = std::vector<Vector>;

/**
 * @brief Closed interval covered by a polygon projected onto an axis
 */
struct Projection {
    double min;
    double max;
};

/**
 * @brief Rotates local vertices about the origin then translates them
 *
 * @param local Vertices relative to the body centre
 * @param pos World position of the body centre
 * @param angleDegrees Rotation in degrees (screen space, clockwise visually)
 * @return Polygon World-space vertices in the same order as @p local
 */
Polygon transformToWorld(const Polygon &local, const Position &pos, double angleDegrees);

/**
 * @brief Arithmetic mean of the vertices
 *
 * Returns the origin for an empty polygon.
 */
Vector vertexCentroid(const Polygon &poly);

/**
 * @brief Projects every vertex of a polygon onto an axis
 *
 * @param poly Non-empty polygon
 * @param axis Projection axis (expected to be unit length)
 */
Projection projectPolygon(const Polygon &poly, const Vector &axis);

/**
 * @brief Builds the convex hull of a point set (Andrew's monotone chain)
 *
 * Points are sorted by x then y, so the result only depends on the set of
 * input points. Collinear and duplicate points are dropped. Inputs with three
 * or fewer points are returned unchanged.
 *
 * @param points Input points (at least one)
 * @return Polygon Hull vertices with positive signed area (counter-clockwise
 *         in a y-up frame)
 */
Polygon convexHull(const Polygon &points);

/**
 * @brief Twice the signed area of a polygon (shoelace formula)
 */
double signedArea2(const Polygon &poly);

#endif // ASTROFIELD_POLYGON_HPP
