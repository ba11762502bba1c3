#pragma once

#include "vhex/geometry/errors.hpp"

#include <stdexcept>
#include <string_view>

namespace vhex {

using geometry::GenerationError;

//! The tessellation cannot be turned into a playable board.
class BoardDegenerateError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Reasons a claim is rejected. Rejections never change the game state.
enum class MoveError {
	UnknownTerritory, //!< No territory with this id.
	AlreadyOwned,     //!< Territory was claimed before.
	NotYourTurn,      //!< Player is not on turn.
	GameOver          //!< Game reached a terminal state.
};

inline constexpr std::string_view toString(MoveError error) {
	switch (error) {
	case MoveError::UnknownTerritory:
		return "UnknownTerritory";
	case MoveError::AlreadyOwned:
		return "AlreadyOwned";
	case MoveError::NotYourTurn:
		return "NotYourTurn";
	case MoveError::GameOver:
		return "GameOver";
	}
	return "Unknown";
}

} // namespace vhex
