#pragma once

#include "vhex/core/board.hpp"
#include "vhex/core/winDetector.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <map>
#include <vector>

namespace vhex {

using Simplex = std::vector<std::size_t>; //!< Sorted vertex list. A k-simplex has k + 1 vertices.

//! Finite abstract simplicial complex. Always closed under taking faces.
class SimplicialComplex {
public:
	//! Add a simplex together with all of its faces.
	void add(Simplex simplex);

	bool contains(const Simplex& simplex) const;
	std::size_t count(std::size_t dim) const; //!< Number of simplices of dimension dim.
	std::size_t dimension() const;            //!< Highest dimension + 1. Zero when empty.

	//! Simplices of one dimension mapped to their basis index in the chain group.
	const std::map<Simplex, std::size_t>& simplices(std::size_t dim) const;

private:
	void insert(const Simplex& simplex);

private:
	std::vector<std::map<Simplex, std::size_t>> m_simplices; //!< Per dimension.
};

//! Boundary map from dim-chains to (dim - 1)-chains over the rationals.
//! Rows follow the (dim - 1)-simplex indices, columns the dim-simplex indices.
Eigen::MatrixXd boundaryMatrix(const SimplicialComplex& complex, std::size_t dim);

//! Rank of the dim-th rational homology group.
std::size_t bettiNumber(const SimplicialComplex& complex, std::size_t dim);

//! Betti numbers of the complex spanned by one player's territories.
struct HomologySummary {
	std::size_t b0; //!< Connected groups.
	std::size_t b1; //!< Enclosed holes.
};

//! Clique complex (up to triangles) of the territories owned by player.
SimplicialComplex ownedComplex(const Board& board, Player player);

HomologySummary summarizeHomology(const Board& board, Player player);

//! Verification detector. Owned complex plus one virtual vertex per side of the player.
//! The player has won iff joining the two virtual vertices by an edge raises the first Betti number.
//! \note Cubic in the number of owned territories. Use for cross checks, not per move.
class HomologyWinDetector : public IWinDetector {
public:
	bool checkWin(const Board& board, Player player) const override;
};

} // namespace vhex
