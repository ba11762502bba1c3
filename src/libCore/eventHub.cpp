#include "vhex/core/eventHub.hpp"

#include <algorithm>

namespace vhex {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_signalListeners.erase(
	        std::remove_if(m_signalListeners.begin(), m_signalListeners.end(), [&](const SignalListenerEntry& e) { return e.listener == listener; }),
	        m_signalListeners.end());
}

void EventHub::subscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_stateListeners.push_back({listener});
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_stateListeners.erase(
	        std::remove_if(m_stateListeners.begin(), m_stateListeners.end(), [&](const StateListenerEntry& e) { return e.listener == listener; }),
	        m_stateListeners.end());
}

void EventHub::signal(GameSignal signal) {
	std::vector<SignalListenerEntry> listeners;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		listeners = m_signalListeners;
	}

	// Called without the lock held so listeners may query the game or unsubscribe.
	for (const auto& [listener, signalMask]: listeners) {
		if (signalMask & signal) {
			listener->onGameEvent(signal);
		}
	}
}

void EventHub::signalDelta(const GameDelta& delta) {
	std::vector<StateListenerEntry> listeners;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		listeners = m_stateListeners;
	}

	for (const auto& entry: listeners) {
		entry.listener->onGameDelta(delta);
	}
}

} // namespace vhex
