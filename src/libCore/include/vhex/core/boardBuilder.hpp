#pragma once

#include "vhex/core/board.hpp"
#include "vhex/geometry/voronoi.hpp"

namespace vhex {

//! Side a region arc belongs to. Top and bottom go to player A, left and right to player B.
Side sideOf(geometry::Arc arc);

//! Turn a clipped tessellation into a board of unclaimed territories.
//! A territory touching several arcs gets the primary tag of the arc nearest to its site; ties go to the lower arc index.
//! \throws BoardDegenerateError if a side has no territory or the adjacency graph is disconnected.
Board buildBoard(const geometry::Tessellation& tessellation);

} // namespace vhex
