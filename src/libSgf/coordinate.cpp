#include "sgf/coordinate.hpp"

#include <format>

namespace kifu {

static constexpr std::string_view SGF_ALPHABET = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

std::optional<Coord> fromSgf(std::string_view s) {
	if (s.size() != 2u) {
		return std::nullopt;
	}

	const Coord c{s[0u] - 'a', s[1u] - 'a'};
	if (c.x < 0 || c.y < 0) {
		return std::nullopt;
	}
	return c;
}

std::string toSgf(const Coord c) {
	const auto limit = static_cast<int>(SGF_ALPHABET.size());
	if (c.x < 0 || c.y < 0 || c.x >= limit || c.y >= limit) {
		return {};
	}
	return {SGF_ALPHABET[c.x], SGF_ALPHABET[c.y]};
}

std::string toDisplay(const Coord c, const std::size_t boardSize) {
	if (c.x < 0 || c.y < 0 || c.x >= static_cast<int>(boardSize) || c.y >= static_cast<int>(boardSize)) {
		return "?";
	}

	// Go boards skip the letter I.
	const char column = static_cast<char>('A' + c.x + (c.x >= 8 ? 1 : 0));
	return std::format("{}{}", column, static_cast<int>(boardSize) - c.y);
}

} // namespace kifu
