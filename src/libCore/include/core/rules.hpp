#pragma once

#include "core/board.hpp"
#include "sgf/gameRecord.hpp"
#include "sgf/types.hpp"

#include <cstddef>
#include <vector>

namespace kifu {

//! Outcome of applying one move to a board.
struct MoveResult {
	bool placed{false};       //!< False for a pass or a coordinate outside of the board.
	std::size_t captures{0u}; //!< Opponent stones removed by the move.
	bool suicide{false};      //!< Own group was removed because it had no liberties left.
};

//! Returns the stones connected to start having the same colour. Empty if there is no stone at start.
std::vector<Coord> collectGroup(const BoardSnapshot& board, Coord start);

//! Returns the number of distinct empty fields adjacent to the group.
std::size_t countLiberties(const BoardSnapshot& board, const std::vector<Coord>& group);

//! Returns the liberties of the group at startCoord. Zero if there is no stone.
std::size_t computeGroupLiberties(const BoardSnapshot& board, Coord startCoord);

//! Place the stone of a move and resolve captures.
//! \note Does not check legality. Occupied fields are overwritten and suicide removes the own group
//!       unless the move captured something.
MoveResult applyMove(BoardSnapshot& board, const Move& move);

} // namespace kifu
