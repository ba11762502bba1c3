#pragma once

#include "vhex/core/types.hpp"
#include "vhex/geometry/point.hpp"
#include "vhex/geometry/region.hpp"

#include <vector>

namespace vhex {

//! Rendering projection of a board. Win logic never reads it.
struct BoardGeometry {
	geometry::RegionShape shape{geometry::RegionShape::Rectangle};
	geometry::Polygon regionOutline{};           //!< Boundary of the playing area.
	std::vector<geometry::Point> sites{};        //!< Generator point per territory.
	std::vector<geometry::Polygon> outlines{};   //!< Clipped polygon per territory.
};

//! Territory graph with ownership. Structure is fixed after construction, only owners change.
class Board {
public:
	//! Possible ownership values of territories.
	enum class Owner { Unclaimed = 0, PlayerA = static_cast<int>(Player::A), PlayerB = static_cast<int>(Player::B) };

	struct Territory {
		Id id;                           //!< Index into the board.
		std::vector<Id> neighbors{};     //!< Sorted ids of adjacent territories.
		Side side{Side::None};           //!< Primary side tag. None for interior territories.
		uint8_t contacts{0};             //!< Mask of all sides the outline touches (see sideBit).
		Owner owner{Owner::Unclaimed};
	};

public:
	Board() = default;
	//! \note Territory ids must equal their index and adjacency must be symmetric.
	Board(std::vector<Territory> territories, BoardGeometry geometry = {});

	std::size_t size() const;
	bool contains(Id id) const;

	const Territory& territory(Id id) const;
	const std::vector<Territory>& territories() const;
	const BoardGeometry& geometry() const;

	void setOwner(Id id, Owner owner); //!< Set owner of an existing territory.
	Owner ownerOf(Id id) const;
	bool isFree(Id id) const;          //!< Returns whether a territory is unclaimed.
	std::size_t freeCount() const;

	bool touches(Id id, Side side) const;    //!< Whether the territory can anchor a chain on side.
	std::vector<Id> members(Side side) const; //!< Territories whose primary tag is side.

private:
	std::vector<Territory> m_territories{};
	BoardGeometry m_geometry{};
};

//! Returns the Board::Owner enum value of input player.
inline constexpr Board::Owner toOwner(Player player) {
	return player == Player::A ? Board::Owner::PlayerA : Board::Owner::PlayerB;
}

} // namespace vhex
