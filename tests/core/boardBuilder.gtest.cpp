#include "testBoards.hpp"
#include "vhex/core/boardBuilder.hpp"
#include "vhex/core/errors.hpp"

#include <gtest/gtest.h>

namespace vhex::gtest {

TEST(BoardBuilder, ArcSides) {
	EXPECT_EQ(sideOf(geometry::Arc::Top), Side::A1);
	EXPECT_EQ(sideOf(geometry::Arc::Bottom), Side::A2);
	EXPECT_EQ(sideOf(geometry::Arc::Left), Side::B1);
	EXPECT_EQ(sideOf(geometry::Arc::Right), Side::B2);
}

TEST(BoardBuilder, Diamond) {
	const auto board = diamondBoard();

	ASSERT_EQ(board.size(), 4u);
	EXPECT_EQ(board.territory(0u).side, Side::B1);
	EXPECT_EQ(board.territory(1u).side, Side::B2);
	EXPECT_EQ(board.territory(2u).side, Side::A1);
	EXPECT_EQ(board.territory(3u).side, Side::A2);

	// Left and right cells reach into the top and bottom corners.
	EXPECT_EQ(board.territory(0u).contacts, sideBit(Side::A1) | sideBit(Side::A2) | sideBit(Side::B1));
	EXPECT_EQ(board.territory(2u).contacts, sideBit(Side::A1));

	EXPECT_EQ(board.territory(0u).neighbors, (std::vector<Id>{2u, 3u}));
	EXPECT_EQ(board.territory(2u).neighbors, (std::vector<Id>{0u, 1u, 3u}));

	const auto& geometry = board.geometry();
	EXPECT_EQ(geometry.shape, geometry::RegionShape::Rectangle);
	EXPECT_EQ(geometry.regionOutline.size(), 4u);
	EXPECT_EQ(geometry.sites.size(), 4u);
	EXPECT_EQ(geometry.outlines.size(), 4u);
	EXPECT_DOUBLE_EQ(geometry.sites[2].y, 0.8);
}

TEST(BoardBuilder, GeneratedBoardsHaveAllSides) {
	for (const auto shape: {geometry::RegionShape::Rectangle, geometry::RegionShape::Disc}) {
		for (uint64_t seed = 1; seed <= 10; ++seed) {
			const auto board = randomBoard(40u, shape, seed);

			ASSERT_EQ(board.size(), 40u);
			EXPECT_EQ(board.geometry().shape, shape);
			for (const auto side: {Side::A1, Side::A2, Side::B1, Side::B2}) {
				EXPECT_FALSE(board.members(side).empty());
			}
			for (const auto& t: board.territories()) {
				// The primary tag is always one of the touched sides.
				if (t.side != Side::None) {
					EXPECT_TRUE((t.contacts & sideBit(t.side)) != 0);
				} else {
					EXPECT_EQ(t.contacts, 0u);
				}
			}
		}
	}
}

TEST(BoardBuilder, MissingSideIsDegenerate) {
	const auto region = geometry::Region::rectangle({0.0, 0.0}, {1.0, 1.0});
	// A vertical column of strips: every strip is equally far from left and right, the tie goes to the right side.
	const auto tessellation = geometry::computeVoronoi({{0.5, 0.1}, {0.5, 0.35}, {0.5, 0.65}, {0.5, 0.9}}, region);

	EXPECT_THROW(buildBoard(tessellation), BoardDegenerateError);
}

} // namespace vhex::gtest
