#include "core/eventHub.hpp"

#include <algorithm>

namespace kifu {

void EventHub::subscribe(IEngineSignalListener* listener, std::uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IEngineSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; }),
	                  m_listeners.end());
}

void EventHub::signal(EngineSignal signal) {
	std::vector<ListenerEntry> listeners;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		listeners = m_listeners;
	}

	// Called without the lock so listeners may call back into the engine.
	for (const auto& [listener, signalMask]: listeners) {
		// An earlier listener may have unsubscribed this one. It might not exist anymore.
		if ((signalMask & signal) && isSubscribed(listener)) {
			listener->onEngineSignal(signal);
		}
	}
}

bool EventHub::isSubscribed(const IEngineSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	return std::any_of(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; });
}

} // namespace kifu
