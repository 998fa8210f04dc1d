#pragma once

#include "sgf/parser.hpp"
#include "sgf/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kifu {

inline constexpr std::size_t DEFAULT_BOARD_SIZE = 19u;
inline constexpr std::size_t MIN_BOARD_SIZE     = 2u;
inline constexpr std::size_t MAX_BOARD_SIZE     = 25u;

//! Informational fields of a record. Never used for replay.
struct GameInfo {
	std::optional<std::string> event;       //!< EV
	std::optional<std::string> playerBlack; //!< PB
	std::optional<std::string> playerWhite; //!< PW
	std::optional<std::string> blackRank;   //!< BR
	std::optional<std::string> whiteRank;   //!< WR
	std::optional<std::string> result;      //!< RE
	std::optional<std::string> date;        //!< DT
	std::optional<std::string> timeLimit;   //!< TM
	std::optional<std::string> overtime;    //!< OT
	std::optional<std::string> komi;        //!< KM
	std::optional<std::string> ruleset;     //!< RU

	bool operator==(const GameInfo&) const = default;
};

//! Stone placed before the first move (AB, AW).
struct SetupStone {
	Stone stone;
	Coord c;

	bool operator==(const SetupStone&) const = default;
};

//! Move of the main line (B, W).
struct Move {
	Stone stone;
	std::optional<Coord> c; //!< Nullopt for a pass.

	bool operator==(const Move&) const = default;
};

//! Playable game reconstructed from a record.
struct GameRecord {
	std::size_t boardSize{DEFAULT_BOARD_SIZE}; //!< Always in [MIN_BOARD_SIZE, MAX_BOARD_SIZE].
	GameInfo info{};
	std::vector<SetupStone> setup{}; //!< In order of appearance.
	std::vector<Move> moves{};       //!< In order of appearance.

public:
	//! Event name if set, the fallback otherwise.
	std::string title(std::string_view fallback = "Untitled") const;

	//! Number of black setup stones. Nullopt for an even game.
	std::optional<std::size_t> handicap() const;

	bool operator==(const GameRecord&) const = default;
};

//! Fold parsed nodes into a game record.
//! \note Never fails. Missing or malformed properties fall back to defaults.
GameRecord buildGameRecord(const SgfTree& tree);

//! Parse and build in one step.
//! \throws ParseError
GameRecord loadGameRecord(std::string_view text);

} // namespace kifu
