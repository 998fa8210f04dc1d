#include "core/playbackClock.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <cstdint>
#include <memory>

namespace kifu {

class PlaybackClock::Implementation {
public:
	Implementation(asio::io_context& context);

	void start(std::chrono::steady_clock::duration interval, Tick tick);
	void stop();
	bool isRunning() const;

private:
	void schedule(std::uint64_t generation); //!< Arm the timer for the next tick of this generation.

private:
	asio::steady_timer m_timer;
	std::chrono::steady_clock::duration m_interval{};
	Tick m_tick;

	bool m_running{false};
	std::uint64_t m_generation{0u}; //!< Bumped on every stop. Handlers of older generations are stale.

	std::shared_ptr<char> m_lifetime{std::make_shared<char>()}; //!< Expires with the clock for handlers still queued.
};

PlaybackClock::Implementation::Implementation(asio::io_context& context) : m_timer(context) {
}

void PlaybackClock::Implementation::start(std::chrono::steady_clock::duration interval, Tick tick) {
	stop();

	m_interval = interval;
	m_tick     = std::move(tick);
	m_running  = true;
	schedule(m_generation);
}

void PlaybackClock::Implementation::stop() {
	if (!m_running) {
		return;
	}

	m_running = false;
	++m_generation;

	// A handler that already expired is still queued on the context. The generation check drops it.
	m_timer.cancel();
}

bool PlaybackClock::Implementation::isRunning() const {
	return m_running;
}

void PlaybackClock::Implementation::schedule(std::uint64_t generation) {
	m_timer.expires_after(m_interval);
	m_timer.async_wait([this, generation, alive = std::weak_ptr<char>(m_lifetime)](const asio::error_code& ec) {
		if (ec || alive.expired()) {
			return; // Cancelled or clock destroyed. Must not touch this.
		}
		if (!m_running || generation != m_generation) {
			return;
		}

		// Copy: the tick may restart the clock with another callback.
		const auto tick = m_tick;
		tick();

		if (m_running && generation == m_generation) {
			schedule(generation);
		}
	});
}


PlaybackClock::PlaybackClock(asio::io_context& context) : m_pimpl(std::make_unique<Implementation>(context)) {
}

PlaybackClock::~PlaybackClock() = default;

void PlaybackClock::start(std::chrono::steady_clock::duration interval, Tick tick) {
	m_pimpl->start(interval, std::move(tick));
}

void PlaybackClock::stop() {
	m_pimpl->stop();
}

bool PlaybackClock::isRunning() const {
	return m_pimpl->isRunning();
}

} // namespace kifu
