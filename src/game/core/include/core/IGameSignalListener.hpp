#pragma once

#include "core/gameEvent.hpp"

namespace monopoly {

//! Coarse change notifications, e.g. for a renderer that redraws the affected area.
//! Called once per subscribed signal at the end of a tick that raised it.
class IGameSignalListener {
public:
	virtual ~IGameSignalListener() = default;

	virtual void onGameEvent(GameSignal signal) = 0;
};

} // namespace monopoly
