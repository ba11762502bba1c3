#include "vhex/core/boardBuilder.hpp"

#include "Logging.hpp"
#include "vhex/core/errors.hpp"

#include <array>
#include <format>
#include <limits>

namespace vhex {

static constexpr std::array<geometry::Arc, geometry::ARC_COUNT> kArcs{geometry::Arc::Bottom, geometry::Arc::Right, geometry::Arc::Top,
                                                                      geometry::Arc::Left};
static constexpr std::array<Side, 4> kSides{Side::A1, Side::A2, Side::B1, Side::B2};

Side sideOf(const geometry::Arc arc) {
	switch (arc) {
	case geometry::Arc::Top:
		return Side::A1;
	case geometry::Arc::Bottom:
		return Side::A2;
	case geometry::Arc::Left:
		return Side::B1;
	case geometry::Arc::Right:
		return Side::B2;
	}
	return Side::None;
}

//! Primary tag: the touched arc nearest to the site. Points on a corner bisector tie and take the lower arc.
static Side primarySide(const geometry::Cell& cell, const geometry::Region& region) {
	Side side     = Side::None;
	double best   = std::numeric_limits<double>::max();
	for (const auto arc: kArcs) {
		if (!cell.touches(arc)) {
			continue;
		}
		const auto d = region.distanceToArc(cell.site, arc);
		if (d < best) {
			best = d;
			side = sideOf(arc);
		}
	}
	return side;
}

static bool isConnected(const std::vector<Board::Territory>& territories) {
	if (territories.empty()) {
		return false;
	}

	std::vector<bool> visited(territories.size(), false);
	std::vector<Id> stack{0u};
	visited[0] = true;

	std::size_t reached = 0;
	while (!stack.empty()) {
		const auto id = stack.back();
		stack.pop_back();
		++reached;

		for (const auto n: territories[id].neighbors) {
			if (!visited[n]) {
				visited[n] = true;
				stack.push_back(n);
			}
		}
	}

	return reached == territories.size();
}

Board buildBoard(const geometry::Tessellation& tessellation) {
	const auto& region = tessellation.region;

	std::vector<Board::Territory> territories;
	territories.reserve(tessellation.cells.size());

	BoardGeometry geometry{
	        .shape         = region.shape(),
	        .regionOutline = region.outline(),
	        .sites         = {},
	        .outlines      = {},
	};

	for (std::size_t i = 0; i < tessellation.cells.size(); ++i) {
		const auto& cell = tessellation.cells[i];

		Board::Territory territory{.id = static_cast<Id>(i)};
		territory.neighbors.reserve(cell.neighbors.size());
		for (const auto n: cell.neighbors) {
			territory.neighbors.push_back(static_cast<Id>(n));
		}
		for (const auto arc: kArcs) {
			if (cell.touches(arc)) {
				territory.contacts |= sideBit(sideOf(arc));
			}
		}
		territory.side = primarySide(cell, region);

		territories.push_back(std::move(territory));
		geometry.sites.push_back(cell.site);
		geometry.outlines.push_back(cell.outline);
	}

	std::array<std::size_t, 4> groupSizes{};
	for (const auto& t: territories) {
		for (std::size_t s = 0; s < kSides.size(); ++s) {
			if (t.side == kSides[s]) {
				++groupSizes[s];
			}
		}
	}

	for (std::size_t s = 0; s < kSides.size(); ++s) {
		if (groupSizes[s] == 0u) {
			const auto message = std::format("Side {} has no territory ({} territories total).", static_cast<int>(kSides[s]), territories.size());
			Logger().Log(Logging::LogLevel::Error, std::format("[BoardBuilder] {}", message));
			throw BoardDegenerateError(message);
		}
	}

	if (!isConnected(territories)) {
		Logger().Log(Logging::LogLevel::Error, "[BoardBuilder] Territory graph is not connected.");
		throw BoardDegenerateError("Territory graph is not connected.");
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[BoardBuilder] Built board with {} territories. Sides A1={} A2={} B1={} B2={}.", territories.size(),
	                                                  groupSizes[0], groupSizes[1], groupSizes[2], groupSizes[3]));

	return Board(std::move(territories), std::move(geometry));
}

} // namespace vhex
