#include "vhex/core/gameState.hpp"

#include "Logging.hpp"

#include <cassert>
#include <format>

namespace vhex {

GameState::GameState(Board board, const Player firstPlayer, std::unique_ptr<IWinDetector> detector)
    : m_board(std::move(board)), m_currentPlayer(firstPlayer), m_detector(std::move(detector)) {
	assert(m_detector);
}

std::optional<MoveError> GameState::validate(const Id territory, const Player player) const {
	if (isTerminal()) {
		return MoveError::GameOver;
	}
	if (!m_board.contains(territory)) {
		return MoveError::UnknownTerritory;
	}
	if (!m_board.isFree(territory)) {
		return MoveError::AlreadyOwned;
	}
	if (player != m_currentPlayer) {
		return MoveError::NotYourTurn;
	}
	return {};
}

MoveResult GameState::claim(const Id territory, const Player player) {
	if (const auto error = validate(territory, player)) {
		return {.accepted = false, .reason = error, .terminal = isTerminal(), .winner = winner()};
	}

	m_board.setOwner(territory, toOwner(player));
	if (m_detector->checkWin(m_board, player)) {
		m_status = player == Player::A ? GameStatus::PlayerAWins : GameStatus::PlayerBWins;
	} else if (m_board.freeCount() == 0u) {
		// A full board without a winner means the board broke the Hex topology.
		Logger().Log(Logging::LogLevel::Error, std::format("[GameState] Board of {} territories filled without a winner.", m_board.size()));
	}

	m_currentPlayer = opponent(m_currentPlayer);
	++m_moveCount;

	return {.accepted = true, .reason = std::nullopt, .terminal = isTerminal(), .winner = winner()};
}

const Board& GameState::board() const {
	return m_board;
}

Player GameState::currentPlayer() const {
	return m_currentPlayer;
}

unsigned GameState::moveCount() const {
	return m_moveCount;
}

GameStatus GameState::status() const {
	return m_status;
}

bool GameState::isTerminal() const {
	return m_status != GameStatus::Ongoing;
}

std::optional<Player> GameState::winner() const {
	switch (m_status) {
	case GameStatus::PlayerAWins:
		return Player::A;
	case GameStatus::PlayerBWins:
		return Player::B;
	case GameStatus::Ongoing:
		break;
	}
	return std::nullopt;
}

} // namespace vhex
