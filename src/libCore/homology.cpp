#include "vhex/core/homology.hpp"

#include <algorithm>
#include <cassert>

namespace vhex {

void SimplicialComplex::add(Simplex simplex) {
	std::sort(simplex.begin(), simplex.end());
	simplex.erase(std::unique(simplex.begin(), simplex.end()), simplex.end());
	if (simplex.empty()) {
		return;
	}

	// Every non empty subset is a face.
	const auto faces = std::size_t{1} << simplex.size();
	for (std::size_t mask = 1; mask < faces; ++mask) {
		Simplex face;
		for (std::size_t i = 0; i < simplex.size(); ++i) {
			if (mask & (std::size_t{1} << i)) {
				face.push_back(simplex[i]);
			}
		}
		insert(face);
	}
}

void SimplicialComplex::insert(const Simplex& simplex) {
	const auto dim = simplex.size() - 1u;
	if (m_simplices.size() <= dim) {
		m_simplices.resize(dim + 1u);
	}

	auto& level = m_simplices[dim];
	level.emplace(simplex, level.size());
}

bool SimplicialComplex::contains(const Simplex& simplex) const {
	if (simplex.empty() || simplex.size() > m_simplices.size()) {
		return false;
	}
	return m_simplices[simplex.size() - 1u].contains(simplex);
}

std::size_t SimplicialComplex::count(const std::size_t dim) const {
	return dim < m_simplices.size() ? m_simplices[dim].size() : 0u;
}

std::size_t SimplicialComplex::dimension() const {
	return m_simplices.size();
}

const std::map<Simplex, std::size_t>& SimplicialComplex::simplices(const std::size_t dim) const {
	static const std::map<Simplex, std::size_t> empty{};
	return dim < m_simplices.size() ? m_simplices[dim] : empty;
}

Eigen::MatrixXd boundaryMatrix(const SimplicialComplex& complex, const std::size_t dim) {
	assert(dim > 0u);

	const auto& faces = complex.simplices(dim - 1u);
	const auto& cells = complex.simplices(dim);

	Eigen::MatrixXd matrix = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(faces.size()), static_cast<Eigen::Index>(cells.size()));
	for (const auto& [simplex, column]: cells) {
		for (std::size_t i = 0; i < simplex.size(); ++i) {
			Simplex face = simplex;
			face.erase(face.begin() + static_cast<std::ptrdiff_t>(i));

			const auto row = faces.at(face);
			matrix(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(column)) = (i % 2u == 0u) ? 1.0 : -1.0;
		}
	}
	return matrix;
}

static std::size_t boundaryRank(const SimplicialComplex& complex, const std::size_t dim) {
	if (dim == 0u || complex.count(dim) == 0u || complex.count(dim - 1u) == 0u) {
		return 0u;
	}

	const Eigen::FullPivLU<Eigen::MatrixXd> lu(boundaryMatrix(complex, dim));
	return static_cast<std::size_t>(lu.rank());
}

std::size_t bettiNumber(const SimplicialComplex& complex, const std::size_t dim) {
	const auto cycles = complex.count(dim) - boundaryRank(complex, dim);
	return cycles - boundaryRank(complex, dim + 1u);
}

//! Whether territories a and b are neighbors.
static bool adjacent(const Board& board, const Id a, const Id b) {
	const auto& neighbors = board.territory(a).neighbors;
	return std::binary_search(neighbors.begin(), neighbors.end(), b);
}

SimplicialComplex ownedComplex(const Board& board, const Player player) {
	const auto owner = toOwner(player);

	SimplicialComplex complex;
	for (const auto& t: board.territories()) {
		if (t.owner != owner) {
			continue;
		}
		complex.add({t.id});

		for (const auto u: t.neighbors) {
			if (u < t.id || board.ownerOf(u) != owner) {
				continue;
			}
			complex.add({t.id, u});

			for (const auto w: board.territory(u).neighbors) {
				if (w > u && board.ownerOf(w) == owner && adjacent(board, t.id, w)) {
					complex.add({t.id, u, w});
				}
			}
		}
	}
	return complex;
}

HomologySummary summarizeHomology(const Board& board, const Player player) {
	const auto complex = ownedComplex(board, player);
	return {.b0 = bettiNumber(complex, 0u), .b1 = bettiNumber(complex, 1u)};
}

bool HomologyWinDetector::checkWin(const Board& board, const Player player) const {
	const auto n     = board.size();
	const auto owner = toOwner(player);

	const std::size_t firstAnchor  = n;
	const std::size_t secondAnchor = n + 1u;

	auto complex = ownedComplex(board, player);
	complex.add({firstAnchor});
	complex.add({secondAnchor});

	for (const auto [side, anchor]: {std::pair{firstSide(player), firstAnchor}, std::pair{secondSide(player), secondAnchor}}) {
		for (const auto& t: board.territories()) {
			if (t.owner != owner || !board.touches(t.id, side)) {
				continue;
			}
			complex.add({t.id, anchor});

			// Fill the fan between the anchor and its adjacent owned territories.
			for (const auto u: t.neighbors) {
				if (u > t.id && board.ownerOf(u) == owner && board.touches(u, side)) {
					complex.add({t.id, u, anchor});
				}
			}
		}
	}

	const auto before = bettiNumber(complex, 1u);
	complex.add({firstAnchor, secondAnchor});
	const auto after = bettiNumber(complex, 1u);

	return after > before;
}

} // namespace vhex
