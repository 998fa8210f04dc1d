#pragma once

#include "core/board.hpp"
#include "core/engineSignal.hpp"
#include "core/eventHub.hpp"
#include "core/playbackClock.hpp"
#include "core/settings.hpp"
#include "sgf/gameRecord.hpp"

#include <cstddef>
#include <optional>

namespace asio {
class io_context;
}

namespace kifu {

//! Last stone put on the board.
struct LastMove {
	Stone stone;
	Coord c;

	bool operator==(const LastMove&) const = default;
};

//! Replays a game record on a board.
//! The board is always the setup stones followed by the first currentIndex() moves of the record.
//! \note Not thread safe. All calls must happen on the thread running the io context, which also drives playback.
class ReplayEngine {
public:
	ReplayEngine(asio::io_context& context, PlaybackSettings settings = {});

	ReplayEngine(const ReplayEngine&)            = delete;
	ReplayEngine& operator=(const ReplayEngine&) = delete;

	void load(GameRecord record); //!< Replace the record and go to the start position. Stops playback first.
	void reset();                 //!< Back to the setup position.
	void clear();                 //!< Drop the record. Leaves an empty board of the last size.

	void stepForward();                    //!< Apply the next move. Finishes playback at the end of the record.
	void stepBack();                       //!< Rebuild the position one move earlier.
	void seek(std::ptrdiff_t targetIndex); //!< Rebuild the position after targetIndex moves. Stops playback.

	void play();       //!< Start stepping forward every play interval.
	void pause();      //!< Stop playback. Safe to call when not playing.
	void togglePlay(); //!< Play if paused, pause if playing.

	//! Change seconds per move. Keeps playing at the new speed if currently playing.
	void setPlayInterval(double seconds);

	//! Append a move to the record and show it immediately.
	//! \note The next load() replaces it unconditionally.
	void playMoveOptimistically(Stone stone, int x, int y);

public:
	const BoardSnapshot& board() const;
	const std::optional<LastMove>& lastMove() const;
	const GameRecord& record() const;

	std::size_t currentIndex() const;
	std::size_t moveCount() const;
	std::size_t blackCaptures() const;    //!< Stones captured by black up to the current position.
	std::size_t whiteCaptures() const;    //!< Stones captured by white up to the current position.
	std::size_t lastCaptureCount() const; //!< Stones captured by the last applied move.

	PlaybackState state() const;
	bool isPlaying() const;
	double playInterval() const;

public:
	void subscribe(IEngineSignalListener* listener, std::uint64_t signalMask);
	void unsubscribe(IEngineSignalListener* listener);

private:
	bool stopPlayback();                   //!< Returns true if playback was running.
	void rebuild(std::size_t targetIndex); //!< Setup position followed by targetIndex moves.
	void applyNext();                      //!< Apply the move at currentIndex and advance.
	void startClock();

private:
	GameRecord m_record{};
	BoardSnapshot m_board;
	std::optional<LastMove> m_lastMove{};

	std::size_t m_currentIndex{0u};
	std::size_t m_blackCaptures{0u};
	std::size_t m_whiteCaptures{0u};
	std::size_t m_lastCaptureCount{0u};

	PlaybackState m_state{PlaybackState::Idle};
	double m_playInterval;

	PlaybackClock m_clock;
	EventHub m_eventHub; //!< Hub to signal updates of the engine state to external components.
};

} // namespace kifu
