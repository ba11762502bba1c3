#pragma once

#include "vhex/core/board.hpp"
#include "vhex/core/eventHub.hpp"
#include "vhex/core/gameConfig.hpp"
#include "vhex/core/gameState.hpp"
#include "vhex/core/homology.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace vhex {

//! Game controller between collaborators (rendering, input) and the core.
//! All mutations go through one mutex. Readers only ever see fully applied claims.
class Game {
public:
	//! Generate a random board and start a game on it. Replaces any running game.
	//! \throws GenerationError if the board geometry cannot be sampled.
	//! \throws BoardDegenerateError if the tessellation has no usable sides.
	Board newGame(const GameConfig& config);

	//! Start a game on a prebuilt board. Replaces any running game.
	void startGame(Board board, Player firstPlayer = Player::A);

	//! Player claims a territory. Claims before the first game report UnknownTerritory.
	MoveResult claimTerritory(Id territory, Player player);

	Board board() const;                  //!< Snapshot for rendering. Empty before the first game.
	GameStatus status() const;            //!< Ongoing before the first game.
	Player currentPlayer() const;         //!< Returns the player on turn.
	std::optional<Player> winner() const; //!< Set once the game is over.
	unsigned moveCount() const;
	bool isActive() const;                //!< A game exists and is not over.

	//! Betti numbers of the player's owned territories. Zero before the first game.
	HomologySummary homology(Player player) const;

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	void replaceState(std::unique_ptr<GameState> state);

private:
	mutable std::mutex m_mutex;         //!< Guards m_state.
	std::unique_ptr<GameState> m_state; //!< Current game. Null before the first game.
	EventHub m_eventHub;                //!< Hub to signal updates of the game state to external components.
};

} // namespace vhex
