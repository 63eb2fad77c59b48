#include "contagion/math/point.hpp"

#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::abs(a - b) < epsilon;
}

Point::Point() : x(0), y(0) {}
Point::Point(double x, double y) : x(x), y(y) {}

Point Point::add(const Point& other) const {
  return Point(this->x + other.x, this->y + other.y);
}

double Point::distance(const Point& other) const {
  double const dx = other.x - this->x;
  double const dy = other.y - this->y;
  return std::sqrt(dx * dx + dy * dy);
}

// operators

Point Point::operator+(const Point& other) const {
  return add(other);
}

Point& Point::operator+=(const Point& other) {
  this->x += other.x;
  this->y += other.y;
  return *this;
}

bool Point::operator==(const Point& other) const {
  return this->x == other.x && this->y == other.y;
}

bool Point::operator!=(const Point& other) const {
  return !(*this == other);
}

Point add(const Point& a, const Point& b) {
  return a.add(b);
}

double distance(const Point& a, const Point& b) {
  return a.distance(b);
}
