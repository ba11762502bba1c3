#pragma once

#include "vhex/geometry/point.hpp"
#include "vhex/geometry/region.hpp"
#include "vhex/geometry/sampler.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vhex::geometry {

//! Voronoi cell of one site, clipped to the region.
struct Cell {
	Point site;                                 //!< Generator point.
	Polygon outline;                            //!< Clipped cell boundary, counter clockwise.
	std::vector<std::size_t> neighbors;         //!< Sites whose cells share an edge with this one. Sorted.
	std::array<double, ARC_COUNT> arcContact{}; //!< Boundary length shared with each region arc.

	bool touches(Arc arc) const; //!< Whether the cell has boundary contact on the arc.
};

//! Voronoi diagram clipped to a region with its Delaunay dual adjacency.
struct Tessellation {
	Region region;
	std::vector<Cell> cells; //!< One cell per site, same order as the sites.
};

//! Compute the clipped Voronoi diagram of the given sites. Delaunay neighbors come from Qhull.
//! \throws GenerationError for sites outside the region, coincident sites or input Qhull cannot triangulate.
Tessellation computeVoronoi(const std::vector<Point>& sites, const Region& region);

//! Sample seedCount sites in region and compute their clipped Voronoi diagram.
//! \throws GenerationError if seedCount < 4 or sampling runs out of attempts.
Tessellation generate(std::size_t seedCount, const Region& region, uint64_t randomSeed, const SamplerOptions& options = {});

} // namespace vhex::geometry
