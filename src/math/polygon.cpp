/**
 * @file polygon.cpp
 * @brief Implementation of polygon transforms, projection and convex hulls
 */

#include "astrofield/math/polygon.hpp"

#include <algorithm>
#include <cmath>

Polygon transformToWorld(const Polygon &local, const Position &pos, double angleDegrees) {
    double const rad = degreesToRadians(angleDegrees);
    double const c = std::cos(rad);
    double const s = std::sin(rad);

    Polygon world;
    world.reserve(local.size());
    for (const auto &v : local) {
        world.emplace_back(pos.x + v.x * c - v.y * s,
                           pos.y + v.x * s + v.y * c);
    }
    return world;
}

Vector vertexCentroid(const Polygon &poly) {
    if (poly.empty()) {
        return {0.0, 0.0};
    }
    Vector sum;
    for (const auto &v : poly) {
        sum += v;
    }
    return sum / static_cast<double>(poly.size());
}

Projection projectPolygon(const Polygon &poly, const Vector &axis) {
    double min = poly.front().dotProduct(axis);
    double max = min;
    for (size_t i = 1; i < poly.size(); ++i) {
        double const d = poly[i].dotProduct(axis);
        if (d < min) {
            min = d;
        }
        if (d > max) {
            max = d;
        }
    }
    return {min, max};
}

/**
 * @brief Orientation of b relative to the directed line o->a
 */
static double turn(const Vector &o, const Vector &a, const Vector &b) {
    return (a - o).cross(b - o);
}

Polygon convexHull(const Polygon &points) {
    if (points.size() <= 3) {
        return points;
    }

    Polygon sorted = points;
    std::sort(sorted.begin(), sorted.end(), [](const Vector &a, const Vector &b) {
        return (a.x == b.x) ? (a.y < b.y) : (a.x < b.x);
    });

    Polygon lower;
    for (const auto &p : sorted) {
        while (lower.size() >= 2 && turn(lower[lower.size() - 2], lower.back(), p) <= 0) {
            lower.pop_back();
        }
        lower.push_back(p);
    }

    Polygon upper;
    for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
        while (upper.size() >= 2 && turn(upper[upper.size() - 2], upper.back(), *it) <= 0) {
            upper.pop_back();
        }
        upper.push_back(*it);
    }

    // Last point of each chain is the first point of the other
    lower.pop_back();
    upper.pop_back();
    lower.insert(lower.end(), upper.begin(), upper.end());
    return lower;
}

double signedArea2(const Polygon &poly) {
    double area = 0.0;
    for (size_t i = 0; i < poly.size(); ++i) {
        const Vector &a = poly[i];
        const Vector &b = poly[(i + 1) % poly.size()];
        area += a.cross(b);
    }
    return area;
}
