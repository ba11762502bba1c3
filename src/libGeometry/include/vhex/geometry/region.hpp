#pragma once

#include "vhex/geometry/point.hpp"

#include <array>
#include <cstddef>
#include <random>

namespace vhex::geometry {

enum class RegionShape { Rectangle, Disc };

//! The four logical boundary arcs in counter clockwise order.
enum class Arc : unsigned { Bottom = 0, Right = 1, Top = 2, Left = 3 };

constexpr std::size_t ARC_COUNT = 4u;

//! Bounded convex area the tessellation is clipped to.
//! The boundary is a counter clockwise polygon. Vertex 0 is the transition from the left to the bottom arc.
//! Each arc covers the same number of consecutive polygon edges.
class Region {
public:
	//! Axis aligned rectangle. Each side is one arc.
	static Region rectangle(Point min, Point max);

	//! Regular polygon approximating a disc. Arc transitions sit at 45, 135, 225 and 315 degrees.
	//! \note segments must be a multiple of 4 and at least 8.
	static Region disc(Point center, double radius, std::size_t segments = 64u);

	RegionShape shape() const;
	const Polygon& outline() const;
	std::size_t edgeCount() const;

	Point edgeStart(std::size_t edge) const;
	Point edgeEnd(std::size_t edge) const;
	Arc arcOf(std::size_t edge) const; //!< Arc a boundary edge belongs to.

	double area() const;
	bool contains(Point p) const;             //!< Inside or on the boundary.
	double distanceToArc(Point p, Arc arc) const;

	//! Length scale used for numeric tolerances (bounding box diagonal).
	double scale() const;

	//! Uniform sample inside the region.
	Point sample(std::mt19937_64& rng) const;

private:
	Region(RegionShape shape, Polygon outline, std::size_t edgesPerArc);

private:
	RegionShape m_shape;
	Polygon m_outline;         //!< Counter clockwise boundary.
	std::size_t m_edgesPerArc; //!< Consecutive edges per arc.
	Point m_min, m_max;        //!< Bounding box.
};

} // namespace vhex::geometry
