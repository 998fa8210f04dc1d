#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace asio {
class io_context;
}

namespace kifu {

//! Periodic tick source running on the io context of its owner.
//! \note Not thread safe. Start, stop and the ticks all run on the thread driving the io context.
class PlaybackClock {
public:
	using Tick = std::function<void()>;

	PlaybackClock(asio::io_context& context);
	~PlaybackClock();

	PlaybackClock(const PlaybackClock&)            = delete;
	PlaybackClock& operator=(const PlaybackClock&) = delete;

	//! Call tick every interval until stopped. Restarts the clock if it is already running.
	void start(std::chrono::steady_clock::duration interval, Tick tick);

	//! Stop ticking. No tick is delivered after this returns. Safe to call multiple times.
	void stop();

	bool isRunning() const;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace kifu
