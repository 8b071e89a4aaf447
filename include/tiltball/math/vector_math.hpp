/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics for the playfield
 *
 * This file provides the geometric primitives the simulation works with:
 * - Vector class for velocities, normals and offsets
 * - Position class for point locations on the playfield
 * - Segment helpers used by the bar contact and hole tests
 *
 * Playfield coordinates are screen-like: x grows to the right, y grows downward.
 */

#ifndef TILTBALL_VECTOR_MATH_HPP
#define TILTBALL_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

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
 * @brief Clamps a value into [lo, hi]
 */
double clampValue(double value, double lo, double hi);

/**
 * @brief Linear interpolation between a and b
 */
double lerp(double a, double b, double t);

/**
 * @brief Represents a 2D point on the playfield
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    Position(double x, double y);

    /**
     * @brief Constructs the point reached by an offset from the origin
     */
    explicit Position(const Vector& offset);

    Position operator+(const Vector& offset) const;
    Position operator-(const Vector& offset) const;

    /**
     * @brief Offset from another position to this one
     * @param from Origin of the offset
     * @return Vector pointing from @p from to this position
     */
    Vector operator-(const Position& from) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    /**
     * @brief Squared distance, used for cheap rejection tests
     */
    double distSquared(const Position& p) const;

    Position& operator+=(const Vector& offset);
    Position& operator-=(const Vector& offset);

    bool operator==(const Position& other) const;
    bool operator!=(const Position& other) const;
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

    /**
     * @brief Constructs the offset of a position from the origin
     * @param p Position to convert
     */
    explicit Vector(const Position& p);

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude */
    double lengthSquared() const;

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
     * @brief Returns normalized vector (length = 1)
     *
     * A zero-length vector normalizes to the given fallback instead of
     * producing NaNs.
     */
    Vector normalized(const Vector& fallback = Vector(1.0, 0.0)) const;

    /**
     * @brief Rotates vector by specified angle
     * @param angle Rotation angle in radians
     * @return Rotated vector
     */
    Vector rotateByAngle(double angle) const;

    /**
     * @brief Projects vector length onto another vector
     * @param onto Vector to project onto
     * @return Projected length
     */
    double projectLength(const Vector &onto) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    bool operator==(const Vector& other) const;
    bool operator!=(const Vector& other) const;
};

Vector operator*(double scalar, const Vector& v);

/**
 * @brief Finds closest point on a line segment to a point
 *
 * A zero-length segment collapses to its start point.
 *
 * @param a Start point of line segment
 * @param b End point of line segment
 * @param p Point to find closest position to
 * @return Position of closest point on segment ab
 */
Position closestPointOnSegment(const Position &a, const Position &b, const Position &p);

/**
 * @brief Distance from a point to a line segment
 */
double distanceToSegment(const Position &a, const Position &b, const Position &p);

#endif // TILTBALL_VECTOR_MATH_HPP
