#include "core/rules.hpp"

#include <array>

namespace kifu {

static constexpr std::array<int, 4> kDx{1, -1, 0, 0};
static constexpr std::array<int, 4> kDy{0, 0, 1, -1};

//! Visited fields of one flood fill, indexed by coordinate.
class FieldSet {
public:
	FieldSet(std::size_t boardSize) : m_size(boardSize), m_fields(boardSize * boardSize, false) {
	}

	//! Returns false if the field was already in the set.
	bool insert(Coord c) {
		const auto index = static_cast<std::size_t>(c.y) * m_size + static_cast<std::size_t>(c.x);
		if (m_fields[index]) {
			return false;
		}
		m_fields[index] = true;
		return true;
	}

private:
	std::size_t m_size;
	std::vector<bool> m_fields;
};

std::vector<Coord> collectGroup(const BoardSnapshot& board, const Coord start) {
	std::vector<Coord> group;
	if (!board.contains(start)) {
		return group;
	}

	const auto colour = board.get(start);
	if (!colour) {
		return group;
	}

	FieldSet visited(board.size());
	std::vector<Coord> stack{start};
	visited.insert(start);

	while (!stack.empty()) {
		const auto c = stack.back();
		stack.pop_back();
		group.push_back(c);

		for (std::size_t i = 0; i < kDx.size(); ++i) {
			const Coord neighbor{c.x + kDx[i], c.y + kDy[i]};
			if (!board.contains(neighbor) || board.get(neighbor) != colour) {
				continue;
			}
			if (visited.insert(neighbor)) {
				stack.push_back(neighbor);
			}
		}
	}

	return group;
}

std::size_t countLiberties(const BoardSnapshot& board, const std::vector<Coord>& group) {
	FieldSet liberties(board.size());
	std::size_t count = 0u;

	for (const auto stone: group) {
		for (std::size_t i = 0; i < kDx.size(); ++i) {
			const Coord neighbor{stone.x + kDx[i], stone.y + kDy[i]};
			if (board.contains(neighbor) && board.isEmpty(neighbor) && liberties.insert(neighbor)) {
				++count;
			}
		}
	}

	return count;
}

std::size_t computeGroupLiberties(const BoardSnapshot& board, const Coord startCoord) {
	return countLiberties(board, collectGroup(board, startCoord));
}

MoveResult applyMove(BoardSnapshot& board, const Move& move) {
	MoveResult result{};
	if (!move.c || !board.contains(*move.c)) {
		return result;
	}

	const auto c     = *move.c;
	const auto enemy = opponent(move.stone);

	board.place(c, move.stone);
	result.placed = true;

	// Remove adjacent enemy groups without liberties. A group touching the stone twice is gone after the first removal.
	for (std::size_t i = 0; i < kDx.size(); ++i) {
		const Coord neighbor{c.x + kDx[i], c.y + kDy[i]};
		if (!board.contains(neighbor) || board.get(neighbor) != enemy) {
			continue;
		}

		const auto group = collectGroup(board, neighbor);
		if (countLiberties(board, group) == 0u) {
			for (const auto stone: group) {
				board.remove(stone);
			}
			result.captures += group.size();
		}
	}

	// Records may contain suicide. Only happens when nothing was captured.
	if (result.captures == 0u) {
		const auto ownGroup = collectGroup(board, c);
		if (countLiberties(board, ownGroup) == 0u) {
			for (const auto stone: ownGroup) {
				board.remove(stone);
			}
			result.suicide = true;
		}
	}

	return result;
}

} // namespace kifu
