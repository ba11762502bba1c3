#pragma once

#include <cstdint>
#include <string_view>

namespace vhex {

using Id = unsigned; //!< Territory ID used by the core library.

enum class Player { A = 1, B = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::A ? Player::B : Player::A;
}

inline constexpr std::string_view toString(Player player) {
	return player == Player::A ? "A" : "B";
}

//! Logical board sides. Player A connects A1 (top) with A2 (bottom), player B connects B1 (left) with B2 (right).
enum class Side : uint8_t { None = 0, A1 = 1, A2 = 2, B1 = 3, B2 = 4 };

//! Bit of a side in a side mask.
inline constexpr uint8_t sideBit(Side side) {
	return side == Side::None ? 0u : static_cast<uint8_t>(1u << (static_cast<unsigned>(side) - 1u));
}

//! The two sides a player has to connect.
inline constexpr Side firstSide(Player player) {
	return player == Player::A ? Side::A1 : Side::B1;
}
inline constexpr Side secondSide(Player player) {
	return player == Player::A ? Side::A2 : Side::B2;
}

enum class GameStatus {
	Ongoing,     //!< Claims accepted.
	PlayerAWins, //!< Player A connected top and bottom.
	PlayerBWins  //!< Player B connected left and right.
};

//! Types of notifications.
enum GameSignal : uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< Board was modified.
	GS_PlayerChange = 1 << 1, //!< Active player changed.
	GS_StateChange  = 1 << 2, //!< Game state changed. Started or finished.
};

} // namespace vhex
