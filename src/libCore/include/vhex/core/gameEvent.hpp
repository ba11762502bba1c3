#pragma once

#include "vhex/core/types.hpp"

namespace vhex {

//! State change caused by one accepted claim.
struct GameDelta {
	unsigned moveId;   //!< Move number after the claim.
	Player player;     //!< Player who claimed.
	Id territory;      //!< Claimed territory.
	Player nextPlayer; //!< Player on turn after the claim.
	GameStatus status; //!< Status after the claim.
};

} // namespace vhex
