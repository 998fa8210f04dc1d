#include "core/replayEngine.hpp"
#include "core/rules.hpp"

#include "Logging.hpp"
#include "sgf/coordinate.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace kifu {

ReplayEngine::ReplayEngine(asio::io_context& context, PlaybackSettings settings)
    : m_board{m_record.boardSize}, m_playInterval{std::max(MIN_PLAY_INTERVAL, settings.playInterval)}, m_clock{context} {
}

void ReplayEngine::load(GameRecord record) {
	// The clock has to be stopped before the record changes. A stale tick would step the new record.
	const auto wasPlaying = stopPlayback();

	m_record = std::move(record);
	m_state  = PlaybackState::Ready;
	rebuild(0u);

	core::Logger().Log(Logging::LogLevel::Info, std::format("[Engine] Loaded '{}': size {}, {} setup stones, {} moves.", m_record.title(),
	                                                        m_record.boardSize, m_record.setup.size(), m_record.moves.size()));

	m_eventHub.signal(ES_GameLoaded);
	m_eventHub.signal(ES_BoardChange);
	m_eventHub.signal(ES_PositionChange);
	if (wasPlaying) {
		m_eventHub.signal(ES_PlaybackChange);
	}
}

void ReplayEngine::reset() {
	const auto wasPlaying = stopPlayback();
	rebuild(0u);

	m_eventHub.signal(ES_BoardChange);
	m_eventHub.signal(ES_PositionChange);
	if (wasPlaying) {
		m_eventHub.signal(ES_PlaybackChange);
	}
}

void ReplayEngine::clear() {
	const auto wasPlaying = stopPlayback();

	// Keep the board size so the empty board looks like the last game.
	m_record = GameRecord{.boardSize = m_record.boardSize};
	m_state  = PlaybackState::Idle;
	rebuild(0u);

	core::Logger().Log(Logging::LogLevel::Info, "[Engine] Cleared record.");

	m_eventHub.signal(ES_GameLoaded);
	m_eventHub.signal(ES_BoardChange);
	m_eventHub.signal(ES_PositionChange);
	if (wasPlaying) {
		m_eventHub.signal(ES_PlaybackChange);
	}
}

void ReplayEngine::stepForward() {
	if (m_currentIndex >= m_record.moves.size()) {
		if (stopPlayback()) {
			core::Logger().Log(Logging::LogLevel::Info, std::format("[Engine] Playback finished after {} moves.", m_currentIndex));

			m_eventHub.signal(ES_PlaybackChange);
			m_eventHub.signal(ES_GameFinished);
		}
		return;
	}

	applyNext();

	if (m_lastMove) {
		core::Logger().Log(Logging::LogLevel::Debug, std::format("[Engine] Move {}: {} {} captured {}.", m_currentIndex, toString(m_lastMove->stone),
		                                                         toDisplay(m_lastMove->c, m_board.size()), m_lastCaptureCount));
	} else {
		core::Logger().Log(Logging::LogLevel::Debug, std::format("[Engine] Move {}: pass.", m_currentIndex));
	}

	m_eventHub.signal(ES_BoardChange);
	m_eventHub.signal(ES_PositionChange);
}

void ReplayEngine::stepBack() {
	if (m_currentIndex == 0u) {
		return;
	}

	// Captures cannot be undone from the last move alone. Replay from the setup instead.
	rebuild(m_currentIndex - 1u);

	m_eventHub.signal(ES_BoardChange);
	m_eventHub.signal(ES_PositionChange);
}

void ReplayEngine::seek(const std::ptrdiff_t targetIndex) {
	const auto target = static_cast<std::size_t>(std::clamp<std::ptrdiff_t>(targetIndex, 0, static_cast<std::ptrdiff_t>(m_record.moves.size())));

	const auto wasPlaying = stopPlayback();
	rebuild(target);

	core::Logger().Log(Logging::LogLevel::Info, std::format("[Engine] Seek to move {} (requested {}).", target, targetIndex));

	m_eventHub.signal(ES_BoardChange);
	m_eventHub.signal(ES_PositionChange);
	if (wasPlaying) {
		m_eventHub.signal(ES_PlaybackChange);
	}
}

void ReplayEngine::play() {
	if (m_state != PlaybackState::Ready) {
		return;
	}

	m_state = PlaybackState::Playing;
	startClock();

	core::Logger().Log(Logging::LogLevel::Info, std::format("[Engine] Playback started at move {} ({}s per move).", m_currentIndex, m_playInterval));
	m_eventHub.signal(ES_PlaybackChange);
}

void ReplayEngine::pause() {
	if (stopPlayback()) {
		core::Logger().Log(Logging::LogLevel::Info, std::format("[Engine] Playback paused at move {}.", m_currentIndex));
		m_eventHub.signal(ES_PlaybackChange);
	}
}

void ReplayEngine::togglePlay() {
	if (isPlaying()) {
		pause();
	} else {
		play();
	}
}

void ReplayEngine::setPlayInterval(const double seconds) {
	m_playInterval = std::max(MIN_PLAY_INTERVAL, seconds);

	if (isPlaying()) {
		startClock();
	}
}

void ReplayEngine::playMoveOptimistically(const Stone stone, const int x, const int y) {
	// The new move follows the last move of the record, not the shown position.
	if (m_currentIndex != m_record.moves.size()) {
		rebuild(m_record.moves.size());
	}

	m_record.moves.push_back({stone, Coord{x, y}});
	applyNext();

	if (m_state == PlaybackState::Idle) {
		m_state = PlaybackState::Ready;
	}

	core::Logger().Log(Logging::LogLevel::Debug, std::format("[Engine] Optimistic move {}: {} ({}, {}).", m_currentIndex, toString(stone), x, y));

	m_eventHub.signal(ES_BoardChange);
	m_eventHub.signal(ES_PositionChange);
}

const BoardSnapshot& ReplayEngine::board() const {
	return m_board;
}

const std::optional<LastMove>& ReplayEngine::lastMove() const {
	return m_lastMove;
}

const GameRecord& ReplayEngine::record() const {
	return m_record;
}

std::size_t ReplayEngine::currentIndex() const {
	return m_currentIndex;
}

std::size_t ReplayEngine::moveCount() const {
	return m_record.moves.size();
}

std::size_t ReplayEngine::blackCaptures() const {
	return m_blackCaptures;
}

std::size_t ReplayEngine::whiteCaptures() const {
	return m_whiteCaptures;
}

std::size_t ReplayEngine::lastCaptureCount() const {
	return m_lastCaptureCount;
}

PlaybackState ReplayEngine::state() const {
	return m_state;
}

bool ReplayEngine::isPlaying() const {
	return m_state == PlaybackState::Playing;
}

double ReplayEngine::playInterval() const {
	return m_playInterval;
}

void ReplayEngine::subscribe(IEngineSignalListener* listener, std::uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void ReplayEngine::unsubscribe(IEngineSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

bool ReplayEngine::stopPlayback() {
	m_clock.stop();

	if (m_state != PlaybackState::Playing) {
		return false;
	}
	m_state = PlaybackState::Ready;
	return true;
}

void ReplayEngine::rebuild(const std::size_t targetIndex) {
	BoardSnapshot start{m_record.boardSize};
	for (const auto& [stone, c]: m_record.setup) {
		if (start.contains(c)) {
			start.place(c, stone);
		}
	}

	m_board            = std::move(start);
	m_lastMove         = std::nullopt;
	m_currentIndex     = 0u;
	m_blackCaptures    = 0u;
	m_whiteCaptures    = 0u;
	m_lastCaptureCount = 0u;

	while (m_currentIndex < targetIndex) {
		applyNext();
	}
}

void ReplayEngine::applyNext() {
	const auto& move = m_record.moves[m_currentIndex];

	// Published snapshots are never changed in place.
	BoardSnapshot next = m_board;
	const auto result  = applyMove(next, move);
	m_board            = std::move(next);

	m_lastCaptureCount = result.captures;
	if (result.placed) {
		m_lastMove = LastMove{move.stone, *move.c};
		(move.stone == Stone::Black ? m_blackCaptures : m_whiteCaptures) += result.captures;
	} else {
		m_lastMove = std::nullopt;
	}

	++m_currentIndex;
}

void ReplayEngine::startClock() {
	const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(m_playInterval));
	m_clock.start(interval, [this] { stepForward(); });
}

} // namespace kifu
