#include "vhex/core/game.hpp"

#include "Logging.hpp"
#include "vhex/core/boardBuilder.hpp"
#include "vhex/core/homology.hpp"
#include "vhex/geometry/voronoi.hpp"

#include <format>
#include <random>

namespace vhex {

static constexpr char LOG_NEW_GAME[] = "[Game] New game with {} territories on a {} (seed {}).";
static constexpr char LOG_CLAIM[]    = "[Game] Move {}: Player {} claimed territory {}.";
static constexpr char LOG_REJECT[]   = "[Game] Rejected claim of territory {} by Player {}: {}.";
static constexpr char LOG_WINNER[]   = "[Game] Player {} wins after {} moves. Chain homology b0={} b1={}.";
static constexpr char LOG_HOMOLOGY[] = "[Game] Homology after move {}: A b0={} b1={}, B b0={} b1={}.";

static uint64_t drawSeed() {
	std::random_device device;
	return (static_cast<uint64_t>(device()) << 32u) ^ static_cast<uint64_t>(device());
}

Board Game::newGame(const GameConfig& config) {
	const auto seed   = config.randomSeed ? *config.randomSeed : drawSeed();
	const auto region = makeRegion(config);

	// Geometry runs outside the lock. A failure keeps the previous game.
	auto board = buildBoard(geometry::generate(config.seedCount, region, seed, samplerOptions(config)));

	Logger().Log(Logging::LogLevel::Info,
	             std::format(LOG_NEW_GAME, board.size(), region.shape() == geometry::RegionShape::Disc ? "disc" : "rectangle", seed));

	replaceState(std::make_unique<GameState>(board, config.firstPlayer));
	return board;
}

void Game::startGame(Board board, const Player firstPlayer) {
	Logger().Log(Logging::LogLevel::Info, std::format("[Game] New game with {} territories on a prebuilt board.", board.size()));
	replaceState(std::make_unique<GameState>(std::move(board), firstPlayer));
}

void Game::replaceState(std::unique_ptr<GameState> state) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_state = std::move(state);
	}

	m_eventHub.signal(static_cast<GameSignal>(GS_BoardChange | GS_PlayerChange | GS_StateChange));
}

MoveResult Game::claimTerritory(const Id territory, const Player player) {
	MoveResult result{};
	GameDelta delta{};
	{
		std::lock_guard<std::mutex> lock(m_mutex);

		if (!m_state) {
			Logger().Log(Logging::LogLevel::Warning, std::format(LOG_REJECT, territory, toString(player), "no game started"));
			return {.accepted = false, .reason = MoveError::UnknownTerritory, .terminal = false, .winner = std::nullopt};
		}

		result = m_state->claim(territory, player);
		if (!result.accepted) {
			Logger().Log(Logging::LogLevel::Warning, std::format(LOG_REJECT, territory, toString(player), toString(*result.reason)));
			return result;
		}

		Logger().Log(Logging::LogLevel::Info, std::format(LOG_CLAIM, m_state->moveCount(), toString(player), territory));

		const auto homologyA = summarizeHomology(m_state->board(), Player::A);
		const auto homologyB = summarizeHomology(m_state->board(), Player::B);
		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_HOMOLOGY, m_state->moveCount(), homologyA.b0, homologyA.b1, homologyB.b0, homologyB.b1));
		if (result.terminal) {
			const auto& summary = *result.winner == Player::A ? homologyA : homologyB;
			Logger().Log(Logging::LogLevel::Info, std::format(LOG_WINNER, toString(*result.winner), m_state->moveCount(), summary.b0, summary.b1));
		}

		delta = GameDelta{
		        .moveId     = m_state->moveCount(),
		        .player     = player,
		        .territory  = territory,
		        .nextPlayer = m_state->currentPlayer(),
		        .status     = m_state->status(),
		};
	}

	// Listeners run after the claim is committed and the lock is released.
	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(result.terminal ? GS_StateChange : GS_PlayerChange);
	m_eventHub.signalDelta(delta);

	return result;
}

Board Game::board() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state ? m_state->board() : Board{};
}

GameStatus Game::status() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state ? m_state->status() : GameStatus::Ongoing;
}

Player Game::currentPlayer() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state ? m_state->currentPlayer() : Player::A;
}

std::optional<Player> Game::winner() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state ? m_state->winner() : std::nullopt;
}

unsigned Game::moveCount() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state ? m_state->moveCount() : 0u;
}

bool Game::isActive() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state && !m_state->isTerminal();
}

HomologySummary Game::homology(const Player player) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state ? summarizeHomology(m_state->board(), player) : HomologySummary{.b0 = 0u, .b1 = 0u};
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace vhex
