#pragma once

#include "vhex/core/gameEvent.hpp"

namespace vhex {

class IGameStateListener {
public:
	virtual ~IGameStateListener()                    = default;
	virtual void onGameDelta(const GameDelta& delta) = 0;
};

} // namespace vhex
