#include "library/gameLibrary.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace kifu::gtest {

static const std::filesystem::path DATA_DIR = KIFU_TEST_DATA_DIR;

TEST(GameLibrary, LoadFile) {
	const auto entry = loadFile(DATA_DIR / "simple.sgf");
	ASSERT_TRUE(entry);

	EXPECT_EQ(entry->title(), "Kifu Test Cup");
	EXPECT_EQ(entry->record.boardSize, 9u);
	EXPECT_EQ(entry->record.moves.size(), 6u);
	EXPECT_EQ(entry->record.info.playerBlack, "Black Player");
	EXPECT_EQ(entry->record.info.whiteRank, "2d");
	EXPECT_EQ(entry->record.info.komi, "6.5");
	EXPECT_EQ(entry->record.info.result, "W+R");
	EXPECT_FALSE(entry->record.handicap());
}

TEST(GameLibrary, LoadFileFailures) {
	EXPECT_FALSE(loadFile(DATA_DIR / "broken.sgf"));
	EXPECT_FALSE(loadFile(DATA_DIR / "doesNotExist.sgf"));
}

TEST(GameLibrary, TitleFallsBackToFileName) {
	const auto entry = loadFile(DATA_DIR / "folder" / "a.sgf");
	ASSERT_TRUE(entry);

	EXPECT_EQ(entry->title(), "a");
	EXPECT_EQ(entry->record.handicap(), 2u);
}

TEST(GameLibrary, LoadFolder) {
	GameLibrary library;
	EXPECT_TRUE(library.empty());

	// Hidden entries, the text file and the broken record are skipped.
	EXPECT_EQ(library.loadFolder(DATA_DIR / "folder"), 3u);
	ASSERT_EQ(library.size(), 3u);

	const auto& entries = library.entries();
	EXPECT_EQ(entries[0].path.filename().string(), "a.sgf");
	EXPECT_EQ(entries[1].path.filename().string(), "B.SGF");
	EXPECT_EQ(entries[2].path.filename().string(), "c.sgf");

	EXPECT_EQ(entries[1].title(), "Upper Case Extension");
	EXPECT_EQ(entries[1].record.boardSize, 13u);
	EXPECT_EQ(entries[2].record.boardSize, 19u);
}

TEST(GameLibrary, LoadFolderNaturalOrder) {
	GameLibrary library;
	ASSERT_EQ(library.loadFolder(DATA_DIR / "numbered"), 4u);

	std::vector<std::string> names;
	for (const auto& entry: library.entries()) {
		names.push_back(entry.path.filename().string());
	}
	EXPECT_EQ(names, (std::vector<std::string>{"game2.sgf", "Game3.sgf", "game010.sgf", "game10b.sgf"}));
}

TEST(GameLibrary, LoadFolderShuffledKeepsEntries) {
	GameLibrary library;
	EXPECT_EQ(library.loadFolder(DATA_DIR / "folder", true), 3u);

	std::vector<std::string> names;
	for (const auto& entry: library.entries()) {
		names.push_back(entry.path.filename().string());
	}
	std::sort(names.begin(), names.end());
	EXPECT_EQ(names, (std::vector<std::string>{"B.SGF", "a.sgf", "c.sgf"}));
}

TEST(GameLibrary, LoadFolderReplacesEntries) {
	GameLibrary library;
	library.loadFolder(DATA_DIR / "folder");

	EXPECT_EQ(library.loadFolder(DATA_DIR / "doesNotExist"), 0u);
	EXPECT_TRUE(library.empty());
}

} // namespace kifu::gtest
