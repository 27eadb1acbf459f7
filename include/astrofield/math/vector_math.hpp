/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics for the asteroid field
 *
 * Provides the two primitives every other module builds on:
 * - Position for absolute points in viewport pixel space
 * - Vector for directions, drifts and polygon vertices
 *
 * Screen space is used throughout: +x to the right, +y downwards.
 */

#ifndef ASTROFIELD_VECTOR_MATH_HPP
#define ASTROFIELD_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Threshold for floating-point degenerate checks
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Converts degrees to radians
 */
double degreesToRadians(double degrees);

/**
 * @brief Represents a 2D point in viewport pixel space
 */
class Position {
public:
    double x;  ///< X coordinate (pixels)
    double y;  ///< Y coordinate (pixels)

    /** @brief Constructs a Position at (0,0) */
    Position();

    Position(double x, double y);

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Vector& offset) const;
    Vector operator-(const Position& b) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    /**
     * @brief Moves this position by an offset
     * @param offset Displacement to apply
     * @return Reference to this position
     */
    Position& operator+=(const Vector& offset);
    Position& operator-=(const Vector& offset);
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    Vector(double x, double y);

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Calculates 2D cross product with another vector
     * @param other Other vector
     * @return Cross product value (z-component)
     */
    double cross(const Vector &other) const;

    /** @brief Returns perpendicular vector (-y, x) */
    Vector perp() const;

    /**
     * @brief Returns the unit vector in the same direction
     *
     * Zero-length vectors are divided by EPSILON instead of their length, so
     * the result stays finite (and near zero) rather than picking an
     * arbitrary direction.
     */
    Vector normalized() const;

    /**
     * @brief Rotates vector by specified angle
     * @param angle Rotation angle in radians
     * @return Rotated vector
     */
    Vector rotateByAngle(double angle) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
};

#endif // ASTROFIELD_VECTOR_MATH_HPP
