#pragma once

#include "vhex/core/types.hpp"

namespace vhex {

class IGameSignalListener {
public:
	virtual ~IGameSignalListener()              = default;
	virtual void onGameEvent(GameSignal signal) = 0;
};

} // namespace vhex
