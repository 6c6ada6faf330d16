/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics library
 *
 * This file provides the geometric primitives used on the playing surface:
 * - Position class for points in table-local space (origin top-left, y down)
 * - Vector class for velocities and displacements
 */

#ifndef POOLSHOT_VECTOR_MATH_HPP
#define POOLSHOT_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Represents a 2D point on the playing surface
 * 
 * Positions are compared and consumed by value. Adding a Vector
 * displaces the point; subtracting two points yields the Vector between them.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();
    
    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    /**
     * @brief Displaces this position by a vector
     * @param v Displacement
     * @return New position
     */
    Position operator+(const Vector& v) const;

    /**
     * @brief Vector pointing from b to this position
     * @param b Origin of the displacement
     * @return Displacement vector
     */
    Vector operator-(const Position& b) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    /** @brief Exact component-wise equality */
    bool operator==(const Position& p) const;
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 *
 * Used for velocities (table-distance per simulation time unit) and
 * segment directions.
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();
    
    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /**
     * @brief Scales vector by scalar value
     * @param scalar Scale factor
     * @return Scaled vector
     */
    Vector operator*(double scalar) const;

    /**
     * @brief Scales this vector in place
     * @param scalar Scale factor
     * @return Reference to this vector
     */
    Vector& operator*=(double scalar);

    /** @brief Returns vector magnitude */
    double length() const;

    /**
     * @brief Bearing of this vector in degrees
     * @return atan2-based angle in (-180, 180], 0 along +x, clockwise on screen
     */
    double bearingDegrees() const;
};

#endif // POOLSHOT_VECTOR_MATH_HPP
