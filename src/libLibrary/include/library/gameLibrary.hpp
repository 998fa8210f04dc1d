#pragma once

#include "sgf/gameRecord.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kifu {

//! Record loaded from a file.
struct LibraryEntry {
	std::filesystem::path path;
	GameRecord record;

	//! Event name or the file name without extension.
	std::string title() const;
};

//! Read and parse a single record file.
//! \returns Nullopt if the file cannot be read or is not a record. The reason is logged.
std::optional<LibraryEntry> loadFile(const std::filesystem::path& path);

//! Collection of records found in a folder.
class GameLibrary {
public:
	//! Replace the entries with all *.sgf files below folder, sorted by path in case insensitive natural order.
	//! Hidden files and folders are skipped. Files failing to load are logged and skipped.
	//! \returns Number of loaded entries.
	std::size_t loadFolder(const std::filesystem::path& folder, bool shuffle = false);

	const std::vector<LibraryEntry>& entries() const;
	std::size_t size() const;
	bool empty() const;

private:
	std::vector<LibraryEntry> m_entries{};
};

} // namespace kifu
