#include <gtest/gtest.h>
#include <algorithm>
#include "astrofield/math/polygon.hpp"

namespace {

// Every point must be on or left of each CCW hull edge
bool containsPoint(const Polygon &hull, const Vector &p) {
    for (size_t i = 0; i < hull.size(); ++i) {
        const Vector &a = hull[i];
        const Vector &b = hull[(i + 1) % hull.size()];
        if ((b - a).cross(p - a) < -1e-9) {
            return false;
        }
    }
    return true;
}

bool hasVertex(const Polygon &poly, double x, double y) {
    return std::any_of(poly.begin(), poly.end(), [x, y](const Vector &v) {
        return v.x == x && v.y == y;
    });
}

} // namespace

TEST(ConvexHullTest, SmallInputsPassThrough) {
    Polygon one{Vector(1.0, 2.0)};
    Polygon three{Vector(0.0, 0.0), Vector(0.0, 1.0), Vector(1.0, 0.0)};

    EXPECT_EQ(convexHull(one).size(), 1u);

    Polygon hull = convexHull(three);
    ASSERT_EQ(hull.size(), 3u);
    // Order is kept as given
    EXPECT_DOUBLE_EQ(hull[1].y, 1.0);
}

TEST(ConvexHullTest, DropsInteriorAndCollinearPoints) {
    Polygon points{
        Vector(0.0, 0.0), Vector(4.0, 0.0), Vector(4.0, 4.0), Vector(0.0, 4.0),
        Vector(2.0, 2.0),   // interior
        Vector(2.0, 0.0),   // on an edge
        Vector(1.0, 3.0)    // interior
    };

    Polygon hull = convexHull(points);
    ASSERT_EQ(hull.size(), 4u);
    EXPECT_TRUE(hasVertex(hull, 0.0, 0.0));
    EXPECT_TRUE(hasVertex(hull, 4.0, 0.0));
    EXPECT_TRUE(hasVertex(hull, 4.0, 4.0));
    EXPECT_TRUE(hasVertex(hull, 0.0, 4.0));
    EXPECT_FALSE(hasVertex(hull, 2.0, 0.0));
}

TEST(ConvexHullTest, ContainsEveryInputPointWithConsistentWinding) {
    Polygon points{
        Vector(3.1, 0.2), Vector(-1.7, 2.9), Vector(0.4, -2.8), Vector(2.2, 2.5),
        Vector(-2.6, -1.1), Vector(0.9, 0.3), Vector(-0.5, 1.2), Vector(1.8, -1.9),
        Vector(-3.0, 0.6), Vector(0.1, 3.3)
    };

    Polygon hull = convexHull(points);
    ASSERT_GE(hull.size(), 3u);
    EXPECT_GT(signedArea2(hull), 0.0);

    for (const auto &p : points) {
        EXPECT_TRUE(containsPoint(hull, p)) << "(" << p.x << ", " << p.y << ") outside hull";
    }

    // Strictly convex: every consecutive turn has the same sign
    for (size_t i = 0; i < hull.size(); ++i) {
        const Vector &a = hull[i];
        const Vector &b = hull[(i + 1) % hull.size()];
        const Vector &c = hull[(i + 2) % hull.size()];
        EXPECT_GT((b - a).cross(c - b), 0.0);
    }
}

TEST(ConvexHullTest, IndependentOfInputOrder) {
    Polygon points{
        Vector(0.0, 0.0), Vector(5.0, 1.0), Vector(3.0, 4.0), Vector(1.0, 3.0), Vector(2.0, 2.0)
    };
    Polygon reversed(points.rbegin(), points.rend());

    Polygon a = convexHull(points);
    Polygon b = convexHull(reversed);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a[i].x, b[i].x);
        EXPECT_DOUBLE_EQ(a[i].y, b[i].y);
    }
}

TEST(PolygonTest, TransformRotatesThenTranslates) {
    Polygon local{Vector(10.0, 0.0)};
    Polygon world = transformToWorld(local, Position(100.0, 50.0), 90.0);
    ASSERT_EQ(world.size(), 1u);
    EXPECT_NEAR(world[0].x, 100.0, 1e-9);
    EXPECT_NEAR(world[0].y, 60.0, 1e-9);
}

TEST(PolygonTest, ProjectionAndCentroid) {
    Polygon square{Vector(0.0, 0.0), Vector(2.0, 0.0), Vector(2.0, 2.0), Vector(0.0, 2.0)};

    Projection p = projectPolygon(square, Vector(1.0, 0.0));
    EXPECT_DOUBLE_EQ(p.min, 0.0);
    EXPECT_DOUBLE_EQ(p.max, 2.0);

    Vector c = vertexCentroid(square);
    EXPECT_DOUBLE_EQ(c.x, 1.0);
    EXPECT_DOUBLE_EQ(c.y, 1.0);

    Vector none = vertexCentroid(Polygon());
    EXPECT_DOUBLE_EQ(none.x, 0.0);
}
