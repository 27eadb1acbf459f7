#include "astrofield/math/vector_math.hpp"

#include <cmath>

#include "astrofield/core/constants.hpp"

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

double degreesToRadians(double degrees) {
  return degrees * FieldConstants::Pi / 180.0;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::operator Vector() const {
  return {this->x, this->y};
}

Position Position::operator+(const Vector& offset) const {
  return {this->x + offset.x, this->y + offset.y};
}

Vector Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

double Position::dist(const Position& p) const {
  return std::hypot(this->x - p.x, this->y - p.y);
}

Position& Position::operator+=(const Vector& offset) {
    this->x += offset.x;
    this->y += offset.y;
    return *this;
}

Position& Position::operator-=(const Vector& offset) {
    this->x -= offset.x;
    this->y -= offset.y;
    return *this;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

Vector Vector::operator-() const {
    return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

double Vector::length() const {
  return std::hypot(this->x, this->y);
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector &other) const {
  return this->x * other.y - this->y * other.x;
}

Vector Vector::perp() const {
  return {-this->y, this->x};
}

Vector Vector::normalized() const {
  double len = this->length();
  if (len < EPSILON) {
    len = EPSILON;
  }
  return {this->x / len, this->y / len};
}

Vector Vector::rotateByAngle(double angle) const {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return {this->x*c - this->y*s, this->x*s + this->y*c};
}

Vector& Vector::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    return *this;
}
