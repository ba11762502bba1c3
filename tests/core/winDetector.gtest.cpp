#include "testBoards.hpp"
#include "vhex/core/homology.hpp"
#include "vhex/core/winDetector.hpp"

#include <gtest/gtest.h>

namespace vhex::gtest {

TEST(WinDetector, EmptyBoardHasNoWinner) {
	const auto board = hexBoard(4u);
	const UnionFindWinDetector detector;

	EXPECT_FALSE(detector.checkWin(board, Player::A));
	EXPECT_FALSE(detector.checkWin(board, Player::B));
}

TEST(WinDetector, StraightChains) {
	auto board = hexBoard(4u);
	const UnionFindWinDetector detector;

	// Column 2 from top to bottom.
	for (unsigned r = 0; r < 4u; ++r) {
		board.setOwner(r * 4u + 2u, Board::Owner::PlayerA);
	}
	EXPECT_TRUE(detector.checkWin(board, Player::A));
	EXPECT_FALSE(detector.checkWin(board, Player::B));

	// Removing one link breaks the chain.
	board.setOwner(10u, Board::Owner::Unclaimed);
	EXPECT_FALSE(detector.checkWin(board, Player::A));
}

TEST(WinDetector, ChainNeedsAdjacency) {
	auto board = hexBoard(3u);
	const UnionFindWinDetector detector;

	// (0,0) and (1,1) are not hex neighbors.
	board.setOwner(0u, Board::Owner::PlayerB);
	board.setOwner(4u, Board::Owner::PlayerB);
	board.setOwner(5u, Board::Owner::PlayerB);
	EXPECT_FALSE(detector.checkWin(board, Player::B));

	board.setOwner(3u, Board::Owner::PlayerB);
	EXPECT_TRUE(detector.checkWin(board, Player::B));
}

TEST(WinDetector, CornerAnchorsBothSides) {
	auto board = diamondBoard();
	const UnionFindWinDetector detector;

	// The left cell touches the top and bottom edges in the corners.
	board.setOwner(0u, Board::Owner::PlayerA);
	EXPECT_TRUE(detector.checkWin(board, Player::A));
	EXPECT_TRUE(HomologyWinDetector{}.checkWin(board, Player::A));
}

TEST(WinDetector, Diamond) {
	auto board = diamondBoard();
	const UnionFindWinDetector detector;

	// Left and right are not adjacent.
	board.setOwner(0u, Board::Owner::PlayerB);
	board.setOwner(1u, Board::Owner::PlayerB);
	EXPECT_FALSE(detector.checkWin(board, Player::B));

	board.setOwner(2u, Board::Owner::PlayerA);
	EXPECT_FALSE(detector.checkWin(board, Player::A));
	board.setOwner(3u, Board::Owner::PlayerA);
	EXPECT_TRUE(detector.checkWin(board, Player::A));

	// Checking twice gives the same answer.
	EXPECT_TRUE(detector.checkWin(board, Player::A));
	EXPECT_FALSE(detector.checkWin(board, Player::B));
}

TEST(WinDetector, ExhaustiveNoDraw) {
	const UnionFindWinDetector unionFind;
	const HomologyWinDetector homology;

	for (unsigned mask = 0; mask < (1u << 9u); ++mask) {
		auto board = hexBoard(3u);
		for (Id id = 0; id < 9u; ++id) {
			board.setOwner(id, (mask & (1u << id)) ? Board::Owner::PlayerA : Board::Owner::PlayerB);
		}

		const bool a = unionFind.checkWin(board, Player::A);
		const bool b = unionFind.checkWin(board, Player::B);
		EXPECT_NE(a, b) << "Coloring " << mask;
		EXPECT_EQ(homology.checkWin(board, Player::A), a) << "Coloring " << mask;
		EXPECT_EQ(homology.checkWin(board, Player::B), b) << "Coloring " << mask;
	}
}

TEST(WinDetector, FullBoardHasExactlyOneWinner) {
	const UnionFindWinDetector unionFind;
	const HomologyWinDetector homology;

	for (const auto shape: {geometry::RegionShape::Rectangle, geometry::RegionShape::Disc}) {
		for (uint64_t seed = 1; seed <= 20; ++seed) {
			auto board = randomBoard(30u, shape, seed);
			fillRandomly(board, seed * 7u);

			const bool a = unionFind.checkWin(board, Player::A);
			const bool b = unionFind.checkWin(board, Player::B);
			EXPECT_NE(a, b) << "Seed " << seed;
			EXPECT_EQ(homology.checkWin(board, Player::A), a) << "Seed " << seed;
			EXPECT_EQ(homology.checkWin(board, Player::B), b) << "Seed " << seed;
		}
	}
}

TEST(WinDetector, DetectorsAgreeOnPartialBoards) {
	const UnionFindWinDetector unionFind;
	const HomologyWinDetector homology;

	for (uint64_t seed = 1; seed <= 10; ++seed) {
		auto board = randomBoard(40u, geometry::RegionShape::Rectangle, seed);
		fillRandomly(board, seed);

		// Release every third territory.
		for (Id id = 0; id < board.size(); id += 3u) {
			board.setOwner(id, Board::Owner::Unclaimed);
		}

		for (const auto player: {Player::A, Player::B}) {
			EXPECT_EQ(unionFind.checkWin(board, player), homology.checkWin(board, player)) << "Seed " << seed;
		}
	}
}

} // namespace vhex::gtest
