#pragma once

#include "vhex/core/board.hpp"
#include "vhex/core/types.hpp"

namespace vhex {

//! Decides whether a player's territories connect the player's two sides.
//! Implementations are pure: same board, same answer, no side effects.
class IWinDetector {
public:
	virtual ~IWinDetector()                                        = default;
	virtual bool checkWin(const Board& board, Player player) const = 0;
};

//! Union-find over the owned territories and two virtual side nodes. Near linear in board size.
class UnionFindWinDetector : public IWinDetector {
public:
	bool checkWin(const Board& board, Player player) const override;
};

} // namespace vhex
