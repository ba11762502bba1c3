#include "testBoards.hpp"
#include "vhex/core/game.hpp"

#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <utility>
#include <thread>
#include <vector>

namespace vhex::gtest {

class RecordingListener : public IGameSignalListener, public IGameStateListener {
public:
	void onGameEvent(const GameSignal signal) override {
		signals.push_back(signal);
	}
	void onGameDelta(const GameDelta& delta) override {
		deltas.push_back(delta);
	}

	std::vector<GameSignal> signals;
	std::vector<GameDelta> deltas;
};

TEST(Game, ClaimBeforeStart) {
	Game game;

	EXPECT_FALSE(game.isActive());
	EXPECT_EQ(game.board().size(), 0u);
	EXPECT_EQ(game.status(), GameStatus::Ongoing);

	const auto result = game.claimTerritory(0u, Player::A);
	EXPECT_FALSE(result.accepted);
	EXPECT_EQ(result.reason, MoveError::UnknownTerritory);
}

TEST(Game, NewGameFromConfig) {
	Game game;
	const GameConfig config{.seedCount = 25u, .regionShape = geometry::RegionShape::Disc, .randomSeed = 11u};

	const auto board = game.newGame(config);
	EXPECT_EQ(board.size(), 25u);
	EXPECT_EQ(board.freeCount(), 25u);
	EXPECT_EQ(board.geometry().shape, geometry::RegionShape::Disc);
	EXPECT_TRUE(game.isActive());
	EXPECT_EQ(game.currentPlayer(), Player::A);
	EXPECT_EQ(game.moveCount(), 0u);

	// Same seed, same board.
	const auto again = game.newGame(config);
	ASSERT_EQ(again.size(), board.size());
	for (Id id = 0; id < board.size(); ++id) {
		EXPECT_EQ(again.territory(id).neighbors, board.territory(id).neighbors);
	}
}

TEST(Game, FailedGenerationKeepsRunningGame) {
	Game game;
	game.startGame(hexBoard(3u));
	ASSERT_TRUE(game.claimTerritory(4u, Player::A).accepted);

	EXPECT_THROW(game.newGame(GameConfig{.seedCount = 2u}), GenerationError);
	EXPECT_THROW(game.newGame(GameConfig{.seedCount = 30u, .minSeparationFactor = 3.0, .maxAttemptsPerSeed = 5u}), GenerationError);

	EXPECT_EQ(game.board().size(), 9u);
	EXPECT_EQ(game.moveCount(), 1u);
}

TEST(Game, Signals) {
	Game game;
	RecordingListener listener;
	game.subscribeSignals(&listener, GS_BoardChange | GS_PlayerChange | GS_StateChange);
	game.subscribeState(&listener);

	game.startGame(hexBoard(3u));
	ASSERT_EQ(listener.signals.size(), 1u);

	listener.signals.clear();
	ASSERT_TRUE(game.claimTerritory(1u, Player::A).accepted);
	EXPECT_EQ(listener.signals, (std::vector<GameSignal>{GS_BoardChange, GS_PlayerChange}));
	ASSERT_EQ(listener.deltas.size(), 1u);
	EXPECT_EQ(listener.deltas[0].moveId, 1u);
	EXPECT_EQ(listener.deltas[0].player, Player::A);
	EXPECT_EQ(listener.deltas[0].territory, 1u);
	EXPECT_EQ(listener.deltas[0].nextPlayer, Player::B);
	EXPECT_EQ(listener.deltas[0].status, GameStatus::Ongoing);

	// Rejected claims notify nobody.
	listener.signals.clear();
	EXPECT_FALSE(game.claimTerritory(1u, Player::B).accepted);
	EXPECT_TRUE(listener.signals.empty());
	EXPECT_EQ(listener.deltas.size(), 1u);

	ASSERT_TRUE(game.claimTerritory(0u, Player::B).accepted);
	ASSERT_TRUE(game.claimTerritory(4u, Player::A).accepted);
	ASSERT_TRUE(game.claimTerritory(3u, Player::B).accepted);

	listener.signals.clear();
	const auto result = game.claimTerritory(7u, Player::A);
	EXPECT_TRUE(result.terminal);
	EXPECT_EQ(listener.signals, (std::vector<GameSignal>{GS_BoardChange, GS_StateChange}));
	EXPECT_EQ(listener.deltas.back().status, GameStatus::PlayerAWins);
	EXPECT_EQ(game.winner(), Player::A);
	EXPECT_FALSE(game.isActive());

	game.unsubscribeSignals(&listener);
	game.unsubscribeState(&listener);
	listener.signals.clear();
	game.startGame(hexBoard(3u));
	EXPECT_TRUE(listener.signals.empty());
}

TEST(Game, ClaimsAfterWinAreRejected) {
	Game game;
	RecordingListener listener;
	game.startGame(hexBoard(3u));

	// Column 1 connects top and bottom.
	ASSERT_TRUE(game.claimTerritory(1u, Player::A).accepted);
	ASSERT_TRUE(game.claimTerritory(0u, Player::B).accepted);
	ASSERT_TRUE(game.claimTerritory(4u, Player::A).accepted);
	ASSERT_TRUE(game.claimTerritory(3u, Player::B).accepted);
	ASSERT_TRUE(game.claimTerritory(7u, Player::A).terminal);

	game.subscribeSignals(&listener, GS_BoardChange | GS_PlayerChange | GS_StateChange);
	game.subscribeState(&listener);

	for (const auto [territory, player]: {std::pair{2u, Player::B}, std::pair{5u, Player::A}, std::pair{4u, Player::B}, std::pair{99u, Player::B}}) {
		const auto result = game.claimTerritory(territory, player);
		EXPECT_FALSE(result.accepted);
		EXPECT_EQ(result.reason, MoveError::GameOver);
		EXPECT_TRUE(result.terminal);
		EXPECT_EQ(result.winner, Player::A);
	}

	EXPECT_EQ(game.moveCount(), 5u);
	EXPECT_EQ(game.board().freeCount(), 4u);
	EXPECT_EQ(game.status(), GameStatus::PlayerAWins);
	EXPECT_TRUE(listener.signals.empty());
	EXPECT_TRUE(listener.deltas.empty());
}

TEST(Game, HomologyPerPlayer) {
	Game game;
	EXPECT_EQ(game.homology(Player::A).b0, 0u);

	game.startGame(hexBoard(3u));
	// A builds a chain along the top right corner, B holds three separate cells.
	const std::array<std::pair<Id, Id>, 3> moves{{{1u, 0u}, {2u, 8u}, {5u, 4u}}};
	for (const auto [a, b]: moves) {
		ASSERT_TRUE(game.claimTerritory(a, Player::A).accepted);
		ASSERT_TRUE(game.claimTerritory(b, Player::B).accepted);
	}

	const auto a = game.homology(Player::A);
	EXPECT_EQ(a.b0, 1u);
	EXPECT_EQ(a.b1, 0u);

	// No two of 0, 4 and 8 are neighbors.
	const auto b = game.homology(Player::B);
	EXPECT_EQ(b.b0, 3u);
	EXPECT_EQ(b.b1, 0u);
}

TEST(Game, SignalMask) {
	Game game;
	RecordingListener listener;
	game.subscribeSignals(&listener, GS_StateChange);

	game.startGame(hexBoard(3u));
	ASSERT_TRUE(game.claimTerritory(0u, Player::A).accepted);
	ASSERT_TRUE(game.claimTerritory(8u, Player::B).accepted);

	// Only the start of the game matched the mask.
	EXPECT_EQ(listener.signals.size(), 1u);
}

TEST(Game, ConcurrentPlayers) {
	Game game;
	game.newGame(GameConfig{.seedCount = 40u, .randomSeed = 5u});

	std::atomic<unsigned> accepted{0u};
	auto play = [&](const Player player) {
		const auto size = static_cast<Id>(game.board().size());
		while (game.isActive()) {
			for (Id id = 0; id < size && game.isActive(); ++id) {
				if (game.claimTerritory(id, player).accepted) {
					++accepted;
				}
			}
		}
	};

	std::thread a(play, Player::A);
	std::thread b(play, Player::B);
	a.join();
	b.join();

	const auto board = game.board();
	EXPECT_TRUE(game.winner().has_value());
	EXPECT_EQ(accepted.load(), game.moveCount());
	EXPECT_EQ(board.size() - board.freeCount(), game.moveCount());
}

} // namespace vhex::gtest
