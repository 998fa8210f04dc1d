#include "boardPrinter.hpp"
#include "Logging.hpp"

#include "core/replayEngine.hpp"
#include "library/gameLibrary.hpp"

#include <asio/io_context.hpp>

#include <charconv>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

struct Options {
	std::string path;
	std::optional<double> interval;
	std::optional<long> move;
};

void printUsage() {
	std::cout << "Usage: kifu <record.sgf> [--interval <seconds>] [--move <n>]\n";
}

template <typename T>
std::optional<T> parseNumber(std::string_view text) {
	T value{};
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

std::optional<Options> parseOptions(int argc, char** argv) {
	Options options;
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];

		if (arg == "--interval" && i + 1 < argc) {
			options.interval = parseNumber<double>(argv[++i]);
			if (!options.interval) {
				return std::nullopt;
			}
		} else if (arg == "--move" && i + 1 < argc) {
			options.move = parseNumber<long>(argv[++i]);
			if (!options.move) {
				return std::nullopt;
			}
		} else if (options.path.empty() && !arg.starts_with("--")) {
			options.path = arg;
		} else {
			return std::nullopt;
		}
	}

	if (options.path.empty()) {
		return std::nullopt;
	}
	return options;
}

void printInfo(const kifu::LibraryEntry& entry) {
	const auto& info = entry.record.info;
	const auto field = [](const std::optional<std::string>& value) { return value.value_or("?"); };

	std::cout << std::format("{}\n", entry.title());
	std::cout << std::format("Black: {} {}  White: {} {}\n", field(info.playerBlack), info.blackRank.value_or(""), field(info.playerWhite),
	                         info.whiteRank.value_or(""));
	std::cout << std::format("Result: {}  Komi: {}  Date: {}\n", field(info.result), field(info.komi), field(info.date));
	if (const auto handicap = entry.record.handicap()) {
		std::cout << std::format("Handicap: {}\n", *handicap);
	}
}

} // namespace

int main(int argc, char** argv) {
	const auto options = parseOptions(argc, argv);
	if (!options) {
		printUsage();
		return 1;
	}

	auto entry = kifu::loadFile(options->path);
	if (!entry) {
		kifu::app::Logger().Log(Logging::LogLevel::Error, std::format("[Viewer] Could not load '{}'.", options->path));
		std::cerr << std::format("Could not load '{}'.\n", options->path);
		return 1;
	}
	printInfo(*entry);

	asio::io_context context;
	kifu::PlaybackSettings settings;
	if (options->interval) {
		settings.playInterval = *options->interval;
	}

	kifu::ReplayEngine engine(context, settings);
	engine.load(entry->record);

	if (options->move) {
		engine.seek(*options->move);
		kifu::app::drawBoard(std::cout, engine);
		return 0;
	}

	kifu::app::BoardPrinter printer(engine, std::cout);
	engine.subscribe(&printer, kifu::ES_PositionChange | kifu::ES_GameFinished);

	engine.play();
	context.run(); // Returns once playback finished and the clock has no pending tick.

	engine.unsubscribe(&printer);
	kifu::app::Logger().Log(Logging::LogLevel::Info, std::format("[Viewer] Replayed '{}' ({} moves).", entry->title(), engine.moveCount()));
	return printer.finished() ? 0 : 1;
}
