/**
 * @file sat.cpp
 * @brief Implementation of the separating-axis test with MTV output
 */

#include "astrofield/algo/sat.hpp"

#include <algorithm>
#include <limits>

/**
 * @brief Tests every edge normal of @p source as a candidate axis
 *
 * @return false as soon as an axis separates A and B
 */
static bool testEdgeAxes(const Polygon &source,
                         const Polygon &A,
                         const Polygon &B,
                         double &bestOverlap,
                         Vector &bestAxis)
{
    for (size_t i = 0; i < source.size(); ++i) {
        const Vector &p1 = source[i];
        const Vector &p2 = source[(i + 1) % source.size()];
        Vector const edge = p2 - p1;

        // normalized() divides by EPSILON for zero-length edges
        Vector const axis = edge.perp().normalized();

        Projection const pA = projectPolygon(A, axis);
        Projection const pB = projectPolygon(B, axis);

        double const overlap = std::min(pA.max, pB.max) - std::max(pA.min, pB.min);
        if (overlap <= 0.0) {
            return false;
        }
        if (overlap < bestOverlap) {
            bestOverlap = overlap;
            bestAxis = axis;
        }
    }
    return true;
}

std::optional<Mtv> satCollide(const Polygon &A, const Polygon &B) {
    if (A.empty() || B.empty()) {
        return std::nullopt;
    }

    double bestOverlap = std::numeric_limits<double>::infinity();
    Vector bestAxis;

    if (!testEdgeAxes(A, A, B, bestOverlap, bestAxis)) {
        return std::nullopt;
    }
    if (!testEdgeAxes(B, A, B, bestOverlap, bestAxis)) {
        return std::nullopt;
    }
    if (bestOverlap == std::numeric_limits<double>::infinity()) {
        return std::nullopt;
    }

    // Orient the axis from A towards B
    Vector const dir = vertexCentroid(B) - vertexCentroid(A);
    if (dir.dotProduct(bestAxis) < 0.0) {
        bestAxis = -bestAxis;
    }

    return Mtv{bestAxis, bestOverlap};
}
