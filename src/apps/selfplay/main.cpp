#include "Logging.hpp"
#include "vhex/core/errors.hpp"
#include "vhex/core/game.hpp"

#include <format>
#include <iostream>
#include <random>
#include <vector>

using namespace vhex;

//! Ids of all unclaimed territories.
static std::vector<Id> freeTerritories(const Board& board) {
	std::vector<Id> ids;
	for (const auto& t: board.territories()) {
		if (t.owner == Board::Owner::Unclaimed) {
			ids.push_back(t.id);
		}
	}
	return ids;
}

int main(int argc, char* argv[]) {
	GameConfig config{};
	if (argc > 1) {
		const auto loaded = loadConfig(argv[1]);
		if (!loaded) {
			std::cerr << std::format("Could not read config '{}'.\n", argv[1]);
			return 1;
		}
		config = *loaded;
	}

	Game game;
	try {
		game.newGame(config);
	} catch (const GenerationError& ex) {
		app::Logger().Log(Logging::LogLevel::Error, std::format("[SelfPlay] Board generation failed: {}", ex.what()));
		std::cerr << std::format("Board generation failed: {}\nTry fewer territories or a smaller separation.\n", ex.what());
		return 1;
	} catch (const BoardDegenerateError& ex) {
		app::Logger().Log(Logging::LogLevel::Error, std::format("[SelfPlay] Degenerate board: {}", ex.what()));
		std::cerr << std::format("Degenerate board: {}\nTry another seed.\n", ex.what());
		return 1;
	}

	std::mt19937_64 rng(config.randomSeed ? *config.randomSeed : std::random_device{}());
	while (game.isActive()) {
		const auto candidates = freeTerritories(game.board());
		if (candidates.empty()) {
			break;
		}

		std::uniform_int_distribution<std::size_t> pick(0u, candidates.size() - 1u);
		const auto result = game.claimTerritory(candidates[pick(rng)], game.currentPlayer());
		if (!result.accepted) {
			app::Logger().Log(Logging::LogLevel::Error, std::format("[SelfPlay] Claim rejected: {}", toString(*result.reason)));
			return 1;
		}
	}

	const auto winner = game.winner();
	if (!winner) {
		std::cout << std::format("No winner after {} moves.\n", game.moveCount());
		return 1;
	}

	std::cout << std::format("Player {} wins after {} moves on {} territories.\n", toString(*winner), game.moveCount(), game.board().size());
	return 0;
}
