#pragma once

#include <cstdint>

namespace kifu {

//! Types of signals.
enum EngineSignal : std::uint64_t {
	ES_None           = 0,
	ES_BoardChange    = 1 << 0, //!< Board snapshot, last move or captures were replaced.
	ES_PositionChange = 1 << 1, //!< Current move index changed.
	ES_PlaybackChange = 1 << 2, //!< Playback started or stopped.
	ES_GameLoaded     = 1 << 3, //!< A record was loaded or cleared.
	ES_GameFinished   = 1 << 4, //!< Playback reached the end of the record.
	ES_All            = ES_BoardChange | ES_PositionChange | ES_PlaybackChange | ES_GameLoaded | ES_GameFinished,
};

//! Playback state machine.
enum class PlaybackState {
	Idle,   //!< No record loaded.
	Ready,  //!< Record loaded and not playing.
	Playing //!< Playback clock stepping forward.
};

} // namespace kifu
