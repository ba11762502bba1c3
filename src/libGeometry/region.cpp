#include "vhex/geometry/region.hpp"

#include "vhex/geometry/errors.hpp"

#include <algorithm>
#include <cassert>
#include <format>
#include <limits>
#include <numbers>

namespace vhex::geometry {

Region::Region(const RegionShape shape, Polygon outline, const std::size_t edgesPerArc)
    : m_shape{shape}, m_outline{std::move(outline)}, m_edgesPerArc{edgesPerArc}, m_min{m_outline.front()}, m_max{m_outline.front()} {
	for (const auto& p: m_outline) {
		m_min = {std::min(m_min.x, p.x), std::min(m_min.y, p.y)};
		m_max = {std::max(m_max.x, p.x), std::max(m_max.y, p.y)};
	}
}

Region Region::rectangle(const Point min, const Point max) {
	if (!(min.x < max.x && min.y < max.y)) {
		throw GenerationError(std::format("Rectangle region needs min < max, got ({}, {}) and ({}, {}).", min.x, min.y, max.x, max.y));
	}

	return Region(RegionShape::Rectangle, {{min.x, min.y}, {max.x, min.y}, {max.x, max.y}, {min.x, max.y}}, 1u);
}

Region Region::disc(const Point center, const double radius, const std::size_t segments) {
	if (radius <= 0.0 || segments < 8u || segments % ARC_COUNT != 0u) {
		throw GenerationError(std::format("Disc region needs a positive radius and a multiple of 4 segments (>= 8), got r={} n={}.", radius, segments));
	}

	Polygon outline;
	outline.reserve(segments);

	// Start on the bottom left diagonal so vertex 0 is the left/bottom arc transition.
	const double start = 1.25 * std::numbers::pi;
	for (std::size_t k = 0; k < segments; ++k) {
		const double angle = start + 2.0 * std::numbers::pi * static_cast<double>(k) / static_cast<double>(segments);
		outline.push_back({center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)});
	}

	return Region(RegionShape::Disc, std::move(outline), segments / ARC_COUNT);
}

RegionShape Region::shape() const {
	return m_shape;
}

const Polygon& Region::outline() const {
	return m_outline;
}

std::size_t Region::edgeCount() const {
	return m_outline.size();
}

Point Region::edgeStart(const std::size_t edge) const {
	assert(edge < m_outline.size());
	return m_outline[edge];
}

Point Region::edgeEnd(const std::size_t edge) const {
	assert(edge < m_outline.size());
	return m_outline[(edge + 1) % m_outline.size()];
}

Arc Region::arcOf(const std::size_t edge) const {
	assert(edge < m_outline.size());
	return static_cast<Arc>(edge / m_edgesPerArc);
}

double Region::area() const {
	return signedArea(m_outline);
}

bool Region::contains(const Point p) const {
	const double tolerance = 1e-12 * scale();
	for (std::size_t edge = 0; edge < m_outline.size(); ++edge) {
		const auto a = edgeStart(edge);
		const auto b = edgeEnd(edge);
		// Distance of p to the left of the directed edge.
		if (cross(b - a, p - a) / distance(a, b) < -tolerance) {
			return false;
		}
	}
	return true;
}

double Region::distanceToArc(const Point p, const Arc arc) const {
	const auto first = static_cast<std::size_t>(arc) * m_edgesPerArc;

	double best = std::numeric_limits<double>::max();
	for (std::size_t edge = first; edge < first + m_edgesPerArc; ++edge) {
		best = std::min(best, distanceToSegment(p, edgeStart(edge), edgeEnd(edge)));
	}
	return best;
}

double Region::scale() const {
	return distance(m_min, m_max);
}

Point Region::sample(std::mt19937_64& rng) const {
	std::uniform_real_distribution<double> distX(m_min.x, m_max.x);
	std::uniform_real_distribution<double> distY(m_min.y, m_max.y);

	// Rejection against the bounding box. Any region here covers a good share of its box.
	while (true) {
		const Point p{distX(rng), distY(rng)};
		if (contains(p)) {
			return p;
		}
	}
}

} // namespace vhex::geometry
