#pragma once

#include "core/IEngineSignalListener.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace kifu {

//! Allows external components to be updated on engine state changes.
//! \note Signals are synchronous and run on the caller thread after the engine finished its mutation.
class EventHub {
	struct ListenerEntry {
		IEngineSignalListener* listener; //!< Pointer to the listener.
		std::uint64_t signalMask;        //!< What signals the listener cares about.
	};

public:
	void subscribe(IEngineSignalListener* listener, std::uint64_t signalMask);
	void unsubscribe(IEngineSignalListener* listener);

	void signal(EngineSignal signal); //!< Signal a state change.

private:
	bool isSubscribed(const IEngineSignalListener* listener);

private:
	std::mutex m_listenerMutex;
	std::vector<ListenerEntry> m_listeners;
};

} // namespace kifu
