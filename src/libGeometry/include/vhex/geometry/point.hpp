#pragma once

#include <cmath>
#include <vector>

namespace vhex::geometry {

//! Planar coordinate pair.
struct Point {
	double x, y;
};

using Polygon = std::vector<Point>; //!< Vertex loop, counter clockwise unless stated otherwise.

inline constexpr Point operator+(Point a, Point b) {
	return {a.x + b.x, a.y + b.y};
}
inline constexpr Point operator-(Point a, Point b) {
	return {a.x - b.x, a.y - b.y};
}
inline constexpr Point operator*(double s, Point p) {
	return {s * p.x, s * p.y};
}

inline constexpr double dot(Point a, Point b) {
	return a.x * b.x + a.y * b.y;
}

//! z component of the 3D cross product. Positive if b is counter clockwise of a.
inline constexpr double cross(Point a, Point b) {
	return a.x * b.y - a.y * b.x;
}

inline constexpr double squaredDistance(Point a, Point b) {
	return dot(a - b, a - b);
}

inline double distance(Point a, Point b) {
	return std::sqrt(squaredDistance(a, b));
}

//! Distance of p to the closed segment [a, b].
double distanceToSegment(Point p, Point a, Point b);

//! Signed shoelace area. Positive for counter clockwise loops.
double signedArea(const Polygon& polygon);

} // namespace vhex::geometry
