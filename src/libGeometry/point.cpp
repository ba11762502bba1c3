#include "vhex/geometry/point.hpp"

#include <algorithm>

namespace vhex::geometry {

double distanceToSegment(const Point p, const Point a, const Point b) {
	const auto ab     = b - a;
	const auto length = dot(ab, ab);
	if (length == 0.0) {
		return distance(p, a);
	}

	const auto t = std::clamp(dot(p - a, ab) / length, 0.0, 1.0);
	return distance(p, a + t * ab);
}

double signedArea(const Polygon& polygon) {
	double twiceArea = 0.0;
	for (std::size_t i = 0; i < polygon.size(); ++i) {
		twiceArea += cross(polygon[i], polygon[(i + 1) % polygon.size()]);
	}
	return 0.5 * twiceArea;
}

} // namespace vhex::geometry
