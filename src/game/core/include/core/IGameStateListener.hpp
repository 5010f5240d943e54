#pragma once

#include "core/gameEvent.hpp"

namespace monopoly {

//! Receives every transaction of the game in order. Deltas of one tick arrive before its signals.
class IGameStateListener {
public:
	virtual ~IGameStateListener() = default;

	virtual void onGameDelta(const GameDelta& delta) = 0;
};

} // namespace monopoly
