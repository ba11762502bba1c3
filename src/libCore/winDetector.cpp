#include "vhex/core/winDetector.hpp"

#include "vhex/core/unionFind.hpp"

namespace vhex {

bool UnionFindWinDetector::checkWin(const Board& board, const Player player) const {
	const auto n      = board.size();
	const auto owner  = toOwner(player);
	const auto first  = firstSide(player);
	const auto second = secondSide(player);

	// Nodes n and n + 1 stand for the player's two sides.
	UnionFind sets(n + 2u);
	for (const auto& t: board.territories()) {
		if (t.owner != owner) {
			continue;
		}

		if (board.touches(t.id, first)) {
			sets.unite(t.id, n);
		}
		if (board.touches(t.id, second)) {
			sets.unite(t.id, n + 1u);
		}
		for (const auto neighbor: t.neighbors) {
			if (neighbor > t.id && board.ownerOf(neighbor) == owner) {
				sets.unite(t.id, neighbor);
			}
		}
	}

	return sets.connected(n, n + 1u);
}

} // namespace vhex
