#pragma once

#include "core/IEngineSignalListener.hpp"
#include "core/replayEngine.hpp"

#include <ostream>

namespace kifu::app {

//! Print the board in the terminal.
void drawBoard(std::ostream& out, const ReplayEngine& engine);

//! Redraws the board whenever the engine position changes.
class BoardPrinter : public IEngineSignalListener {
public:
	BoardPrinter(const ReplayEngine& engine, std::ostream& out);

	void onEngineSignal(EngineSignal signal) override;

	bool finished() const;

private:
	const ReplayEngine& m_engine;
	std::ostream& m_out;
	bool m_finished{false};
};

} // namespace kifu::app
