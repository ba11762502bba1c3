#include "vhex/core/board.hpp"

#include <algorithm>
#include <cassert>

namespace vhex {

Board::Board(std::vector<Territory> territories, BoardGeometry geometry) : m_territories(std::move(territories)), m_geometry(std::move(geometry)) {
#ifndef NDEBUG
	for (std::size_t i = 0; i < m_territories.size(); ++i) {
		assert(m_territories[i].id == i);
		for (const auto n: m_territories[i].neighbors) {
			assert(n < m_territories.size() && n != i);
			const auto& back = m_territories[n].neighbors;
			assert(std::find(back.begin(), back.end(), static_cast<Id>(i)) != back.end());
		}
	}
#endif
}

std::size_t Board::size() const {
	return m_territories.size();
}

bool Board::contains(const Id id) const {
	return id < m_territories.size();
}

const Board::Territory& Board::territory(const Id id) const {
	assert(contains(id));
	return m_territories[id];
}

const std::vector<Board::Territory>& Board::territories() const {
	return m_territories;
}

const BoardGeometry& Board::geometry() const {
	return m_geometry;
}

void Board::setOwner(const Id id, const Owner owner) {
	assert(contains(id)); // Game state checks the id before claiming.
	m_territories[id].owner = owner;
}

Board::Owner Board::ownerOf(const Id id) const {
	return territory(id).owner;
}

bool Board::isFree(const Id id) const {
	return ownerOf(id) == Owner::Unclaimed;
}

std::size_t Board::freeCount() const {
	return static_cast<std::size_t>(std::count_if(m_territories.begin(), m_territories.end(), [](const Territory& t) { return t.owner == Owner::Unclaimed; }));
}

bool Board::touches(const Id id, const Side side) const {
	if (side == Side::None) {
		return false;
	}
	const auto& t = territory(id);
	return t.side == side || (t.contacts & sideBit(side)) != 0u;
}

std::vector<Id> Board::members(const Side side) const {
	std::vector<Id> result;
	for (const auto& t: m_territories) {
		if (t.side == side) {
			result.push_back(t.id);
		}
	}
	return result;
}

} // namespace vhex
