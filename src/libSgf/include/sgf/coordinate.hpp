#pragma once

#include "sgf/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace kifu {

//! Convert sgf code to game coordinate.
//! \returns Nullopt for anything but two characters or a character before 'a'. Empty string is a pass.
std::optional<Coord> fromSgf(std::string_view s);

//! Convert game coordinate to sgf code. Returns an empty string if it cannot be encoded.
std::string toSgf(Coord c);

//! Human readable coordinate as printed on a board ("D4"). Columns skip 'I', rows count from the bottom.
std::string toDisplay(Coord c, std::size_t boardSize);

} // namespace kifu
