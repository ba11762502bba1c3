#include "vhex/geometry/voronoi.hpp"

#include "Logging.hpp"
#include "vhex/geometry/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <format>
#include <iterator>

#include <libqhull_r/qhull_ra.h>

namespace vhex::geometry {

namespace {

//! Relative tolerance: edges shorter than this times the region scale are treated as points.
constexpr double RELATIVE_TOLERANCE = 1e-10;

//! Delaunay triangulation, scaled last coordinate, keep coplanar points, point at infinity for cocircular input.
constexpr char QHULL_DELAUNAY[] = "qhull d Qbb Qc Qz";

//! Polygon vertex plus the origin of the edge starting at it.
//! Labels >= 0 name the neighbor site whose bisector produced the edge, labels < 0 encode region edge -(label + 1).
struct LabeledVertex {
	Point p;
	long label;
};
using LabeledPolygon = std::vector<LabeledVertex>;

constexpr long boundaryLabel(const std::size_t edge) {
	return -static_cast<long>(edge) - 1;
}
constexpr std::size_t boundaryEdge(const long label) {
	return static_cast<std::size_t>(-(label + 1));
}

Point intersect(const Point a, const Point b, const double sa, const double sb) {
	const auto t = std::clamp(sa / (sa - sb), 0.0, 1.0);
	return a + t * (b - a);
}

//! Keep the part of the polygon closer to site than to other (Sutherland-Hodgman against one half-plane).
//! Edges created by the cut carry otherLabel, cut edges keep their label.
LabeledPolygon clip(const LabeledPolygon& polygon, const Point site, const Point other, const long otherLabel, const double tolerance) {
	const auto normal = other - site;
	const auto offset = 0.5 * (dot(other, other) - dot(site, site));
	const auto slack  = tolerance * std::sqrt(dot(normal, normal));
	auto side         = [&](const Point p) { return dot(p, normal) - offset; };

	LabeledPolygon out;
	out.reserve(polygon.size() + 1);
	for (std::size_t i = 0; i < polygon.size(); ++i) {
		const auto& a  = polygon[i];
		const auto& b  = polygon[(i + 1) % polygon.size()];
		const auto sa  = side(a.p);
		const auto sb  = side(b.p);
		const bool aIn = sa <= slack;
		const bool bIn = sb <= slack;

		if (aIn) {
			out.push_back(a);
			if (!bIn) {
				out.push_back({intersect(a.p, b.p, sa, sb), otherLabel});
			}
		} else if (bIn) {
			out.push_back({intersect(a.p, b.p, sa, sb), a.label});
		}
	}
	return out;
}

//! Drop vertices whose outgoing edge is shorter than tolerance. The incoming edge then reaches the next vertex.
LabeledPolygon removeShortEdges(const LabeledPolygon& polygon, const double tolerance) {
	LabeledPolygon out;
	out.reserve(polygon.size());
	for (std::size_t i = 0; i < polygon.size(); ++i) {
		if (distance(polygon[i].p, polygon[(i + 1) % polygon.size()].p) >= tolerance) {
			out.push_back(polygon[i]);
		}
	}
	return out;
}

//! Mirror images of the sites across the rectangle sides. With them every site is interior to the triangulation,
//! so its Delaunay star is closed. Sites on a side coincide with their image and are skipped.
std::vector<Point> mirroredSites(const std::vector<Point>& sites, const Region& region, const double tolerance) {
	std::vector<Point> mirrored;
	mirrored.reserve(4u * sites.size());
	for (std::size_t edge = 0; edge < region.edgeCount(); ++edge) {
		const auto a = region.edgeStart(edge);
		const auto b = region.edgeEnd(edge);
		const auto d = (1.0 / distance(a, b)) * (b - a);

		for (const auto& site: sites) {
			const auto foot = a + dot(site - a, d) * d;
			if (distance(site, foot) >= tolerance) {
				mirrored.push_back(2.0 * foot - site);
			}
		}
	}
	return mirrored;
}

//! Delaunay neighbors of the first siteCount points, computed by Qhull. Sorted, may contain mirror point ids >= siteCount.
//! \throws GenerationError if Qhull cannot triangulate the points (e.g. all collinear).
std::vector<std::vector<std::size_t>> delaunayNeighbors(const std::vector<Point>& points, const std::size_t siteCount) {
	std::vector<std::vector<std::size_t>> neighbors(siteCount);
	if (points.size() < 3u) {
		// Nothing to triangulate. Two sites are always neighbors.
		for (std::size_t a = 0; a < siteCount; ++a) {
			for (std::size_t b = 0; b < points.size(); ++b) {
				if (a != b) {
					neighbors[a].push_back(b);
				}
			}
		}
		return neighbors;
	}

	std::vector<coordT> coordinates;
	coordinates.reserve(2u * points.size());
	for (const auto& p: points) {
		coordinates.push_back(p.x);
		coordinates.push_back(p.y);
	}

	qhT qhData;
	qhT* qh = &qhData;
	qh_zero(qh, stderr);

	char options[sizeof(QHULL_DELAUNAY)];
	std::copy(std::begin(QHULL_DELAUNAY), std::end(QHULL_DELAUNAY), options);
	const int exitCode = qh_new_qhull(qh, 2, static_cast<int>(points.size()), coordinates.data(), False, options, nullptr, stderr);

	if (exitCode == 0) {
		facetT* facet;
		vertexT* vertex;
		vertexT** vertexp;
		std::vector<std::size_t> ids;

		FORALLfacets {
			if (facet->upperdelaunay) {
				continue;
			}

			ids.clear();
			FOREACHvertex_(facet->vertices) {
				const auto id = qh_pointid(qh, vertex->point);
				if (id >= 0 && static_cast<std::size_t>(id) < points.size()) {
					ids.push_back(static_cast<std::size_t>(id));
				}
			}

			// Every pair of a facet is a candidate. Extra bisectors of non simplicial facets never cut a cell.
			for (const auto a: ids) {
				for (const auto b: ids) {
					if (a != b && a < siteCount) {
						neighbors[a].push_back(b);
					}
				}
			}
		}
	}

	qh_freeqhull(qh, !qh_ALL);
	int curlong = 0;
	int totlong = 0;
	qh_memfreeshort(qh, &curlong, &totlong);
	if (curlong || totlong) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Voronoi] Qhull did not free {} blocks ({} bytes).", curlong, totlong));
	}

	if (exitCode != 0) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Voronoi] Qhull failed on {} points with exit code {}.", points.size(), exitCode));
		throw GenerationError(std::format("Delaunay triangulation of {} sites failed (Qhull exit code {}).", siteCount, exitCode));
	}

	for (auto& list: neighbors) {
		std::sort(list.begin(), list.end());
		list.erase(std::unique(list.begin(), list.end()), list.end());
	}
	return neighbors;
}

void validateSites(const std::vector<Point>& sites, const Region& region, const double tolerance) {
	for (std::size_t i = 0; i < sites.size(); ++i) {
		if (!region.contains(sites[i])) {
			throw GenerationError(std::format("Site {} at ({}, {}) lies outside the region.", i, sites[i].x, sites[i].y));
		}
		for (std::size_t j = 0; j < i; ++j) {
			if (distance(sites[i], sites[j]) < tolerance) {
				throw GenerationError(std::format("Sites {} and {} coincide.", j, i));
			}
		}
	}
}

} // namespace

bool Cell::touches(const Arc arc) const {
	return arcContact[static_cast<std::size_t>(arc)] > 0.0;
}

Tessellation computeVoronoi(const std::vector<Point>& sites, const Region& region) {
	const auto tolerance = RELATIVE_TOLERANCE * region.scale();
	validateSites(sites, region, tolerance);

	LabeledPolygon boundary;
	boundary.reserve(region.edgeCount());
	for (std::size_t edge = 0; edge < region.edgeCount(); ++edge) {
		boundary.push_back({region.edgeStart(edge), boundaryLabel(edge)});
	}

	Tessellation result{.region = region, .cells = {}};
	result.cells.reserve(sites.size());

	auto points = sites;
	if (region.shape() == RegionShape::Rectangle) {
		const auto mirrored = mirroredSites(sites, region, tolerance);
		points.insert(points.end(), mirrored.begin(), mirrored.end());
	}
	const auto delaunay = delaunayNeighbors(points, sites.size());

	std::vector<std::vector<std::size_t>> candidates(sites.size());

	for (std::size_t i = 0; i < sites.size(); ++i) {
		const auto site = sites[i];

		// The cell is the region cut by the bisector of every Delaunay neighbor.
		// Mirror images bisect along the rectangle sides, which the region outline already carries.
		auto polygon = boundary;
		for (const auto j: delaunay[i]) {
			if (j < sites.size()) {
				polygon = clip(polygon, site, sites[j], static_cast<long>(j), tolerance);
			}
		}
		polygon = removeShortEdges(polygon, tolerance);
		if (polygon.size() < 3u) {
			throw GenerationError(std::format("Cell of site {} collapsed during clipping.", i));
		}

		Cell cell{.site = site, .outline = {}, .neighbors = {}, .arcContact = {}};
		cell.outline.reserve(polygon.size());
		for (std::size_t k = 0; k < polygon.size(); ++k) {
			const auto& v = polygon[k];
			cell.outline.push_back(v.p);

			if (v.label < 0) {
				const auto arc = region.arcOf(boundaryEdge(v.label));
				cell.arcContact[static_cast<std::size_t>(arc)] += distance(v.p, polygon[(k + 1) % polygon.size()].p);
			} else {
				candidates[i].push_back(static_cast<std::size_t>(v.label));
			}
		}
		std::sort(candidates[i].begin(), candidates[i].end());
		candidates[i].erase(std::unique(candidates[i].begin(), candidates[i].end()), candidates[i].end());

		result.cells.push_back(std::move(cell));
	}

	// Keep an adjacency only when both cells kept the shared edge.
	std::size_t adjacencies = 0;
	for (std::size_t i = 0; i < sites.size(); ++i) {
		for (const auto j: candidates[i]) {
			if (std::binary_search(candidates[j].begin(), candidates[j].end(), i)) {
				result.cells[i].neighbors.push_back(j);
				++adjacencies;
			}
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Voronoi] Computed {} cells with {} adjacencies.", result.cells.size(), adjacencies / 2));
	return result;
}

Tessellation generate(const std::size_t seedCount, const Region& region, const uint64_t randomSeed, const SamplerOptions& options) {
	if (seedCount < 4u) {
		throw GenerationError(std::format("A board needs at least 4 sites, got {}.", seedCount));
	}

	std::mt19937_64 rng(randomSeed);
	const auto sites = samplePoints(region, seedCount, options, rng);

	Logger().Log(Logging::LogLevel::Info, std::format("[Voronoi] Sampled {} sites with seed {}.", sites.size(), randomSeed));
	return computeVoronoi(sites, region);
}

} // namespace vhex::geometry
