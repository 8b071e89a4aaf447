#include "tiltball/math/vector_math.hpp"

#include <algorithm>
#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

double clampValue(double value, double lo, double hi) {
  return std::max(lo, std::min(hi, value));
}

double lerp(double a, double b, double t) {
  return a + (b - a) * t;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::Position(const Vector& offset) : x(offset.x), y(offset.y) {}

Position Position::operator+(const Vector& offset) const {
  return {this->x + offset.x, this->y + offset.y};
}

Position Position::operator-(const Vector& offset) const {
  return {this->x - offset.x, this->y - offset.y};
}

Vector Position::operator-(const Position& from) const {
  return {this->x - from.x, this->y - from.y};
}

double Position::dist(const Position& p) const {
  return std::sqrt(distSquared(p));
}

double Position::distSquared(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return dx * dx + dy * dy;
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

bool Position::operator==(const Position& other) const {
  return this->x == other.x && this->y == other.y;
}

bool Position::operator!=(const Position& other) const {
  return !(*this == other);
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

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
  return std::sqrt(lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
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

Vector Vector::normalized(const Vector& fallback) const {
  double const len = length();
  if (len < EPSILON) {
    return fallback;
  }
  return {this->x / len, this->y / len};
}

Vector Vector::rotateByAngle(double angle) const {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return {this->x * c - this->y * s, this->x * s + this->y * c};
}

double Vector::projectLength(const Vector &onto) const {
  double const len = onto.length();
  if (len < EPSILON) {
    return 0.0;
  }
  return dotProduct(onto) / len;
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

Vector& Vector::operator*=(double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  return *this;
}

bool Vector::operator==(const Vector& other) const {
  return this->x == other.x && this->y == other.y;
}

bool Vector::operator!=(const Vector& other) const {
  return !(*this == other);
}

Vector operator*(double scalar, const Vector& v) {
  return v * scalar;
}

Position closestPointOnSegment(const Position &a, const Position &b, const Position &p) {
  Vector const ab = b - a;
  double const lengthSq = ab.lengthSquared();
  if (lengthSq < EPSILON) {
    return a;
  }
  double const t = clampValue((p - a).dotProduct(ab) / lengthSq, 0.0, 1.0);
  return a + ab * t;
}

double distanceToSegment(const Position &a, const Position &b, const Position &p) {
  return p.dist(closestPointOnSegment(a, b, p));
}
