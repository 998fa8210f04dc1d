#include "library/gameLibrary.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <random>
#include <sstream>
#include <string_view>

namespace kifu {

std::string LibraryEntry::title() const {
	return record.title(path.stem().string());
}

static bool isHidden(const std::filesystem::path& path) {
	const auto name = path.filename().string();
	return !name.empty() && name.front() == '.';
}

static bool isRecordFile(const std::filesystem::path& path) {
	auto extension = path.extension().string();
	std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return extension == ".sgf";
}

//! Case insensitive order in which digit runs compare by value, so "game2" comes before "game10".
static bool naturalLess(std::string_view a, std::string_view b) {
	const auto isDigit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
	const auto lower   = [](char c) { return std::tolower(static_cast<unsigned char>(c)); };

	std::size_t i = 0u;
	std::size_t j = 0u;
	while (i < a.size() && j < b.size()) {
		if (isDigit(a[i]) && isDigit(b[j])) {
			const auto startA = i;
			const auto startB = j;
			while (i < a.size() && isDigit(a[i])) {
				++i;
			}
			while (j < b.size() && isDigit(b[j])) {
				++j;
			}

			auto numberA = a.substr(startA, i - startA);
			auto numberB = b.substr(startB, j - startB);
			numberA.remove_prefix(std::min(numberA.find_first_not_of('0'), numberA.size()));
			numberB.remove_prefix(std::min(numberB.find_first_not_of('0'), numberB.size()));

			if (numberA.size() != numberB.size()) {
				return numberA.size() < numberB.size();
			}
			if (numberA != numberB) {
				return numberA < numberB;
			}
			continue;
		}

		if (lower(a[i]) != lower(b[j])) {
			return lower(a[i]) < lower(b[j]);
		}
		++i;
		++j;
	}

	if (a.size() - i != b.size() - j) {
		return a.size() - i < b.size() - j;
	}
	return a < b; // Same in natural order. Keep a strict order.
}

std::optional<LibraryEntry> loadFile(const std::filesystem::path& path) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		library::Logger().Log(Logging::LogLevel::Error, std::format("[Library] Could not open '{}'.", path.string()));
		return std::nullopt;
	}

	std::stringstream buffer;
	buffer << file.rdbuf();

	try {
		auto entry = LibraryEntry{path, loadGameRecord(buffer.str())};
		library::Logger().Log(Logging::LogLevel::Info, std::format("[Library] Loaded '{}' from '{}'.", entry.title(), path.string()));
		return entry;
	} catch (const ParseError& ex) {
		library::Logger().Log(Logging::LogLevel::Error, std::format("[Library] Failed to parse '{}': {}", path.string(), ex.what()));
	}
	return std::nullopt;
}

std::size_t GameLibrary::loadFolder(const std::filesystem::path& folder, const bool shuffle) {
	m_entries.clear();

	std::error_code ec{};
	std::vector<std::filesystem::path> files;

	auto it = std::filesystem::recursive_directory_iterator(folder, std::filesystem::directory_options::skip_permission_denied, ec);
	if (ec) {
		library::Logger().Log(Logging::LogLevel::Error, std::format("[Library] Could not open folder '{}': {}", folder.string(), ec.message()));
		return 0u;
	}

	const auto end = std::filesystem::recursive_directory_iterator();
	while (it != end) {
		if (isHidden(it->path())) {
			if (it->is_directory(ec)) {
				it.disable_recursion_pending();
			}
		} else if (it->is_regular_file(ec) && isRecordFile(it->path())) {
			files.push_back(it->path());
		}

		it.increment(ec);
		if (ec) {
			library::Logger().Log(Logging::LogLevel::Warning, std::format("[Library] Stopped scanning '{}': {}", folder.string(), ec.message()));
			break;
		}
	}

	std::sort(files.begin(), files.end(),
	          [](const std::filesystem::path& lhs, const std::filesystem::path& rhs) { return naturalLess(lhs.generic_string(), rhs.generic_string()); });
	if (shuffle) {
		std::shuffle(files.begin(), files.end(), std::mt19937{std::random_device{}()});
	}

	for (const auto& path: files) {
		if (auto entry = loadFile(path)) {
			m_entries.push_back(std::move(*entry));
		}
	}

	library::Logger().Log(Logging::LogLevel::Info,
	                      std::format("[Library] Loaded {} of {} records from '{}'.", m_entries.size(), files.size(), folder.string()));
	return m_entries.size();
}

const std::vector<LibraryEntry>& GameLibrary::entries() const {
	return m_entries;
}

std::size_t GameLibrary::size() const {
	return m_entries.size();
}

bool GameLibrary::empty() const {
	return m_entries.empty();
}

} // namespace kifu
