#pragma once

#include "core/IGameSignalListener.hpp"
#include "core/IGameStateListener.hpp"

#include <mutex>
#include <vector>

namespace monopoly {

//! Allows external components to be updated on internal game events.
//! \note Signals are synchronous and run on the thread calling Game::tick.
//! Listeners may unsubscribe from within a callback; the change applies to the next signal.
class EventHub {
	struct SignalListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};
	struct StateListenerEntry {
		IGameStateListener* listener; //!< Pointer to the listener.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	//! Signal every bit set in the mask. Each listener is called once per matching bit, in bit order.
	void signal(uint64_t signals);
	//! Forward deltas in order to all state listeners.
	void signalDeltas(const std::vector<GameDelta>& deltas);

private:
	std::mutex m_listenerMutex;
	std::vector<SignalListenerEntry> m_signalListeners;
	std::vector<StateListenerEntry> m_stateListeners;
};

} // namespace monopoly
