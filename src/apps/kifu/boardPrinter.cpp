#include "boardPrinter.hpp"

#include <format>

namespace kifu::app {

void drawBoard(std::ostream& out, const ReplayEngine& engine) {
	const auto& board = engine.board();
	const auto size   = static_cast<int>(board.size());

	out << "    ";
	for (int x = 0; x != size; ++x) {
		out << static_cast<char>('A' + x + (x >= 8 ? 1 : 0)) << ' ';
	}
	out << '\n';

	for (int y = 0; y != size; ++y) {
		out << std::format("{:>3} ", size - y);
		for (int x = 0; x != size; ++x) {
			const Coord c{x, y};
			const auto stone = board.get(c);

			char symb = '.';
			if (stone) {
				symb = *stone == Stone::Black ? 'x' : 'o';
			}
			// Mark the last stone in upper case.
			if (stone && engine.lastMove() && engine.lastMove()->c == c) {
				symb = *stone == Stone::Black ? 'X' : 'O';
			}
			out << symb << ' ';
		}
		out << '\n';
	}

	out << std::format("Move {}/{}  Captures B:{} W:{}\n", engine.currentIndex(), engine.moveCount(), engine.blackCaptures(), engine.whiteCaptures());
}

BoardPrinter::BoardPrinter(const ReplayEngine& engine, std::ostream& out) : m_engine(engine), m_out(out) {
}

void BoardPrinter::onEngineSignal(EngineSignal signal) {
	switch (signal) {
	case ES_PositionChange:
		m_out << "\033[2J\033[1;1H";
		drawBoard(m_out, m_engine);
		m_out << std::flush;
		break;
	case ES_GameFinished:
		m_finished = true;
		m_out << "Game finished.\n";
		break;
	default:
		break;
	}
}

bool BoardPrinter::finished() const {
	return m_finished;
}

} // namespace kifu::app
