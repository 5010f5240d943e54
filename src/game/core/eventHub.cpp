#include "core/eventHub.hpp"

#include <algorithm>

namespace monopoly {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	std::erase_if(m_signalListeners, [&](const SignalListenerEntry& e) { return e.listener == listener; });
}

void EventHub::subscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_stateListeners.push_back({listener});
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	std::erase_if(m_stateListeners, [&](const StateListenerEntry& e) { return e.listener == listener; });
}

void EventHub::signal(uint64_t signals) {
	if (signals == GS_None) {
		return;
	}

	std::vector<SignalListenerEntry> listeners;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		listeners = m_signalListeners;
	}

	for (uint64_t bit = 1u; bit != 0u && bit <= signals; bit <<= 1u) {
		if (!(signals & bit)) {
			continue;
		}
		for (const auto& [listener, signalMask]: listeners) {
			if (signalMask & bit) {
				listener->onGameEvent(static_cast<GameSignal>(bit));
			}
		}
	}
}

void EventHub::signalDeltas(const std::vector<GameDelta>& deltas) {
	if (deltas.empty()) {
		return;
	}

	std::vector<StateListenerEntry> listeners;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		listeners = m_stateListeners;
	}

	for (const auto& delta: deltas) {
		for (const auto& entry: listeners) {
			entry.listener->onGameDelta(delta);
		}
	}
}

} // namespace monopoly
