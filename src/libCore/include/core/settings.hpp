#pragma once

namespace kifu {

inline constexpr double DEFAULT_PLAY_INTERVAL = 0.75; //!< Seconds between two moves during playback.
inline constexpr double MIN_PLAY_INTERVAL     = 0.05; //!< Faster playback is clamped to this.

//! Tunables of the replay engine.
struct PlaybackSettings {
	double playInterval{DEFAULT_PLAY_INTERVAL}; //!< Seconds per move. Clamped to MIN_PLAY_INTERVAL.
};

} // namespace kifu
