#include <gtest/gtest.h>
#include <cmath>
#include "astrofield/core/constants.hpp"
#include "astrofield/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);  // Parameterized constructor
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorAddition) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    // Test operator+
    Vector result = v1 + v2;
    EXPECT_DOUBLE_EQ(result.x, 4.0);
    EXPECT_DOUBLE_EQ(result.y, 6.0);

    // Test operator+=
    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    // Test operator-=
    v1 -= v2;
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v1.y, 2.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);
    double scalar = 2.0;

    // Test multiplication
    Vector mult_result = v * scalar;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    // Test division
    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);

    // Test negation
    Vector neg = -v;
    EXPECT_DOUBLE_EQ(neg.x, -2.0);
    EXPECT_DOUBLE_EQ(neg.y, -3.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);

    // Test length
    EXPECT_DOUBLE_EQ(v.length(), 5.0);

    // Test normalized
    Vector n = v.normalized();
    EXPECT_NEAR(n.length(), 1.0, EPSILON);
    EXPECT_DOUBLE_EQ(n.x, 0.6);

    // Test cross product
    Vector v5(1.0, 0.0);
    Vector v6(0.0, 1.0);
    EXPECT_DOUBLE_EQ(v5.cross(v6), 1.0);
    EXPECT_DOUBLE_EQ(v6.cross(v5), -1.0);

    // Test perpendicular vector
    Vector v7(1.0, 0.0);
    Vector perp_v7 = v7.perp();
    EXPECT_DOUBLE_EQ(perp_v7.x, 0.0);
    EXPECT_DOUBLE_EQ(perp_v7.y, 1.0);

    // Test rotate by angle
    Vector v10(1.0, 0.0);
    Vector rotated_v10 = v10.rotateByAngle(FieldConstants::Pi / 2);
    EXPECT_NEAR(rotated_v10.x, 0.0, EPSILON);
    EXPECT_NEAR(rotated_v10.y, 1.0, EPSILON);
}

TEST(VectorMathTest, NormalizedZeroVectorStaysFinite) {
    Vector zero;
    Vector n = zero.normalized();
    EXPECT_TRUE(std::isfinite(n.x));
    EXPECT_TRUE(std::isfinite(n.y));
    EXPECT_DOUBLE_EQ(n.x, 0.0);
    EXPECT_DOUBLE_EQ(n.y, 0.0);
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);

    // Offset by a vector
    Position p3 = p1 + Vector(3.0, 4.0);
    EXPECT_DOUBLE_EQ(p3.x, 4.0);
    EXPECT_DOUBLE_EQ(p3.y, 6.0);

    // Difference is a vector
    Vector d = p2 - p1;
    EXPECT_DOUBLE_EQ(d.x, 2.0);
    EXPECT_DOUBLE_EQ(d.y, 2.0);

    // Test distance
    EXPECT_DOUBLE_EQ(p1.dist(p2), 2.8284271247461903);  // sqrt(8)

    p1 += Vector(1.0, 1.0);
    EXPECT_DOUBLE_EQ(p1.x, 2.0);
    p1 -= Vector(2.0, 0.0);
    EXPECT_DOUBLE_EQ(p1.x, 0.0);
    EXPECT_DOUBLE_EQ(p1.y, 3.0);
}

TEST(VectorMathTest, VectorPositionConversion) {
    Position p(1.0, 2.0);
    Vector v = static_cast<Vector>(p);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);
}

TEST(VectorMathTest, DotProduct) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}

TEST(VectorMathTest, DegreesAndFrameScale) {
    EXPECT_NEAR(degreesToRadians(180.0), FieldConstants::Pi, EPSILON);
    EXPECT_TRUE(nearlyEqual(degreesToRadians(90.0), FieldConstants::Pi / 2));

    // One nominal frame, a stalled frame, and a very short one
    EXPECT_NEAR(FieldConstants::frameScale(16.67, 0.5, 2.0), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(FieldConstants::frameScale(1000.0, 0.5, 2.0), 2.0);
    EXPECT_DOUBLE_EQ(FieldConstants::frameScale(1.0, 0.5, 2.0), 0.5);
}
