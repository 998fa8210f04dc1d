#pragma once

#include "sgf/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace kifu {

//! Square grid of stones. A field without a stone holds no value.
//! \note Coordinates origin is at the top left of the board and start at 0.
class BoardSnapshot {
public:
	BoardSnapshot(std::size_t size);

	std::size_t size() const;

	void place(Coord c, Stone stone);        //!< Put a stone, replacing whatever was on the field.
	void remove(Coord c);                    //!< Remove the stone from the field if any.
	std::optional<Stone> get(Coord c) const; //!< Stone at given coordinate (x,y) \in [0, size-1]
	bool isEmpty(Coord c) const;             //!< Returns whether a certain board coordinate is free.
	bool contains(Coord c) const;            //!< Returns whether the coordinate lies on the board.

	std::size_t stoneCount() const;            //!< Number of stones on the board.
	std::size_t stoneCount(Stone stone) const; //!< Number of stones of one colour.

	bool operator==(const BoardSnapshot&) const = default;

private:
	std::size_t m_size;                          //!< Board size
	std::vector<std::optional<Stone>> m_board{}; //!< Row major fields.
};

} // namespace kifu
