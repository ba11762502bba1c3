#pragma once

#include "vhex/core/board.hpp"
#include "vhex/core/errors.hpp"
#include "vhex/core/types.hpp"
#include "vhex/core/winDetector.hpp"

#include <memory>
#include <optional>

namespace vhex {

//! Outcome of a claim request.
struct MoveResult {
	bool accepted{false};            //!< Claim was applied.
	std::optional<MoveError> reason; //!< Set for rejected claims.
	bool terminal{false};            //!< Game is over after this request.
	std::optional<Player> winner;    //!< Set once the game is over.
};

//! Board ownership, turn order and terminal status of one game.
class GameState {
public:
	//! Start a game on a board of unclaimed territories.
	GameState(Board board, Player firstPlayer = Player::A, std::unique_ptr<IWinDetector> detector = std::make_unique<UnionFindWinDetector>());

	//! Player claims a territory. A rejected claim leaves the state untouched.
	MoveResult claim(Id territory, Player player);

	const Board& board() const;
	Player currentPlayer() const;
	unsigned moveCount() const;
	GameStatus status() const;
	bool isTerminal() const;
	std::optional<Player> winner() const;

private:
	std::optional<MoveError> validate(Id territory, Player player) const;

private:
	Board m_board;
	Player m_currentPlayer;
	unsigned m_moveCount{0};
	GameStatus m_status{GameStatus::Ongoing};

	std::unique_ptr<IWinDetector> m_detector; //!< Only consulted by claim. The state alone declares winners.
};

} // namespace vhex
