#include "poolshot/math/vector_math.hpp"
#include "poolshot/math/constants.hpp"

#include <cmath>

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y};
}

Vector Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

double Position::dist(const Position& p) const {
	double const dx = p.x - this->x;
	double const dy = p.y - this->y;
	return std::sqrt(dx * dx + dy * dy);
}

bool Position::operator==(const Position& p) const {
  return this->x == p.x && this->y == p.y;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector& Vector::operator*=(double scalar) {
    this->x *= scalar;
    this->y *= scalar;
    return *this;
}

double Vector::length() const {
	return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::bearingDegrees() const {
  return std::atan2(this->y, this->x) * MathConstants::DEG_PER_RAD;
}
