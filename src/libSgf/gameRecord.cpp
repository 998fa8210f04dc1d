#include "sgf/gameRecord.hpp"
#include "sgf/coordinate.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <limits>
#include <unordered_map>

namespace kifu {

std::string GameRecord::title(std::string_view fallback) const {
	if (info.event && !info.event->empty()) {
		return *info.event;
	}
	return std::string(fallback);
}

std::optional<std::size_t> GameRecord::handicap() const {
	const auto count = static_cast<std::size_t>(std::count_if(setup.begin(), setup.end(), [](const SetupStone& s) { return s.stone == Stone::Black; }));
	if (count == 0u) {
		return std::nullopt;
	}
	return count;
}


//! Numbers too large for int saturate so the caller can clamp them.
static std::optional<int> toInt(std::string_view s) {
	int value = 0;
	const auto* end      = s.data() + s.size();
	const auto [ptr, ec] = std::from_chars(s.data(), end, value);
	if (ptr != end) {
		return std::nullopt;
	}
	if (ec == std::errc::result_out_of_range) {
		return s.starts_with('-') ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
	}
	if (ec != std::errc{}) {
		return std::nullopt;
	}
	return value;
}

//! SZ is "N" or "W:H". Rectangular boards use the smaller side.
static std::optional<std::size_t> parseBoardSize(std::string_view value) {
	int size = 0;

	if (const auto colon = value.find(':'); colon != std::string_view::npos) {
		const auto left  = toInt(value.substr(0u, colon)).value_or(static_cast<int>(DEFAULT_BOARD_SIZE));
		const auto right = toInt(value.substr(colon + 1u)).value_or(left);
		size             = std::min(left, right);
	} else if (const auto parsed = toInt(value)) {
		size = *parsed;
	} else {
		return std::nullopt;
	}

	return static_cast<std::size_t>(std::clamp(size, static_cast<int>(MIN_BOARD_SIZE), static_cast<int>(MAX_BOARD_SIZE)));
}

//! Accumulates a record node by node.
class GameRecordBuilder {
public:
	void add(const SgfNode& node);
	GameRecord finish();

private:
	void addSetup(Stone stone, const std::vector<std::string>& values);
	void addMove(Stone stone, const std::vector<std::string>& values);
	void addInfo(std::optional<std::string>& field, const std::vector<std::string>& values);

private:
	GameRecord m_record{};
	bool m_sizeSet{false};
	std::size_t m_droppedSetup{0u};
};

void GameRecordBuilder::add(const SgfNode& node) {
	using InfoField = std::optional<std::string> GameInfo::*;

	static const std::unordered_map<std::string_view, InfoField> kInfo = {
	        {"EV", &GameInfo::event},     {"PB", &GameInfo::playerBlack}, {"PW", &GameInfo::playerWhite}, {"BR", &GameInfo::blackRank},
	        {"WR", &GameInfo::whiteRank}, {"RE", &GameInfo::result},      {"DT", &GameInfo::date},        {"TM", &GameInfo::timeLimit},
	        {"OT", &GameInfo::overtime},  {"KM", &GameInfo::komi},        {"RU", &GameInfo::ruleset},
	};

	for (const auto& [key, values]: node.properties()) {
		if (key == "SZ") {
			if (!m_sizeSet && !values.empty()) {
				if (const auto size = parseBoardSize(values.front())) {
					m_record.boardSize = *size;
					m_sizeSet          = true;
				}
			}
		} else if (key == "AB") {
			addSetup(Stone::Black, values);
		} else if (key == "AW") {
			addSetup(Stone::White, values);
		} else if (key == "B") {
			addMove(Stone::Black, values);
		} else if (key == "W") {
			addMove(Stone::White, values);
		} else if (const auto it = kInfo.find(key); it != kInfo.end()) {
			addInfo(m_record.info.*(it->second), values);
		}
	}
}

GameRecord GameRecordBuilder::finish() {
	if (m_droppedSetup != 0u) {
		sgf::Logger().Log(Logging::LogLevel::Warning, std::format("[Record] Dropped {} setup stones with invalid coordinates.", m_droppedSetup));
	}
	return std::move(m_record);
}

void GameRecordBuilder::addSetup(const Stone stone, const std::vector<std::string>& values) {
	for (const auto& value: values) {
		if (const auto c = fromSgf(value)) {
			m_record.setup.push_back({stone, *c});
		} else {
			++m_droppedSetup;
		}
	}
}

void GameRecordBuilder::addMove(const Stone stone, const std::vector<std::string>& values) {
	// Empty or undecodable values are passes.
	const auto c = values.empty() ? std::nullopt : fromSgf(values.front());
	m_record.moves.push_back({stone, c});
}

void GameRecordBuilder::addInfo(std::optional<std::string>& field, const std::vector<std::string>& values) {
	if (field || values.empty() || values.front().empty()) {
		return;
	}
	field = values.front();
}


GameRecord buildGameRecord(const SgfTree& tree) {
	GameRecordBuilder builder;
	for (const auto& node: tree.nodes) {
		builder.add(node);
	}

	auto record = builder.finish();
	sgf::Logger().Log(Logging::LogLevel::Info, std::format("[Record] Built '{}': size {}, {} setup stones, {} moves.", record.title(), record.boardSize,
	                                                         record.setup.size(), record.moves.size()));
	return record;
}

GameRecord loadGameRecord(std::string_view text) {
	return buildGameRecord(parse(text));
}

} // namespace kifu
