/**
 * @file point.hpp
 * @brief 2D point mathematics for cell locations and directions
 *
 * A Point is used both for absolute locations in the world and for
 * per-tick displacement vectors (a cell's direction). It provides:
 * - Component-wise addition
 * - Euclidean distance between two points
 * - Approximate equality for floating-point comparisons
 */

#ifndef CONTAGION_POINT_HPP
#define CONTAGION_POINT_HPP

/**
 * @brief Threshold for floating point equality tests
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
bool nearlyEqual(double a, double b, double epsilon = EPSILON);

/**
 * @brief Represents a 2D point (or displacement) in world space
 */
class Point {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Point at (0,0) */
    Point();

    /**
     * @brief Constructs a Point at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Point(double x, double y);

    /**
     * @brief Adds two points
     * @param other Point to add
     * @return New point at the component-wise sum
     */
    Point add(const Point& other) const;

    /**
     * @brief Calculates Euclidean distance to another point
     * @param other Target point
     * @return Non-negative distance between the points
     */
    double distance(const Point& other) const;

    Point operator+(const Point& other) const;
    Point& operator+=(const Point& other);

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const;
};

/** @brief Free-function form of Point::add */
Point add(const Point& a, const Point& b);

/** @brief Free-function form of Point::distance */
double distance(const Point& a, const Point& b);

#endif // CONTAGION_POINT_HPP
