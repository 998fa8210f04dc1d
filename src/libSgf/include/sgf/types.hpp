#pragma once

namespace kifu {

//! Coordinate pair for the board.
//! \note Origin is at the top left of the board and starts at 0, matching SGF ordering.
struct Coord {
	int x, y;

	bool operator==(const Coord&) const = default;
};

enum class Stone { Black = 1, White = 2 };

//! Returns the opponent enum value of input stone.
inline constexpr Stone opponent(Stone stone) {
	return stone == Stone::White ? Stone::Black : Stone::White;
}

//! Returns "Black" or "White".
inline constexpr const char* toString(Stone stone) {
	return stone == Stone::White ? "White" : "Black";
}

} // namespace kifu
