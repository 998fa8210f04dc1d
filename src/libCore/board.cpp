#include "core/board.hpp"

#include <algorithm>
#include <cassert>

namespace kifu {

BoardSnapshot::BoardSnapshot(std::size_t size) : m_size(size), m_board(size * size) {
}

std::size_t BoardSnapshot::size() const {
	return m_size;
}

void BoardSnapshot::place(Coord c, Stone stone) {
	assert(contains(c)); // Rules check the bounds before placing.
	m_board[c.y * m_size + c.x] = stone;
}

void BoardSnapshot::remove(Coord c) {
	assert(contains(c));
	m_board[c.y * m_size + c.x].reset();
}

std::optional<Stone> BoardSnapshot::get(Coord c) const {
	assert(contains(c));
	return m_board[c.y * m_size + c.x];
}

bool BoardSnapshot::isEmpty(Coord c) const {
	return !get(c).has_value();
}

bool BoardSnapshot::contains(Coord c) const {
	return c.x >= 0 && c.y >= 0 && static_cast<std::size_t>(c.x) < m_size && static_cast<std::size_t>(c.y) < m_size;
}

std::size_t BoardSnapshot::stoneCount() const {
	return static_cast<std::size_t>(std::count_if(m_board.begin(), m_board.end(), [](const auto& field) { return field.has_value(); }));
}

std::size_t BoardSnapshot::stoneCount(Stone stone) const {
	return static_cast<std::size_t>(std::count(m_board.begin(), m_board.end(), std::optional<Stone>{stone}));
}

} // namespace kifu
