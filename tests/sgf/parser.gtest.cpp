#include "sgf/parser.hpp"

#include <gtest/gtest.h>

namespace kifu::gtest {

TEST(Parser, SingleNode) {
	const auto tree = parse("(;GM[1]FF[4]SZ[9])");

	ASSERT_EQ(tree.nodes.size(), 1u);
	const auto& node = tree.nodes[0u];
	EXPECT_EQ(node.properties().size(), 3u);
	EXPECT_EQ(node.values("GM"), std::vector<std::string>{"1"});
	EXPECT_EQ(node.values("FF"), std::vector<std::string>{"4"});
	EXPECT_EQ(node.values("SZ"), std::vector<std::string>{"9"});
	EXPECT_TRUE(node.values("KM").empty());
	EXPECT_FALSE(node.has("KM"));
}

TEST(Parser, MainLineOrder) {
	const auto tree = parse("(;SZ[19];B[pd];W[dp];B[pp];W[dd])");

	ASSERT_EQ(tree.nodes.size(), 5u);
	EXPECT_EQ(tree.nodes[1u].values("B").front(), "pd");
	EXPECT_EQ(tree.nodes[2u].values("W").front(), "dp");
	EXPECT_EQ(tree.nodes[3u].values("B").front(), "pp");
	EXPECT_EQ(tree.nodes[4u].values("W").front(), "dd");
}

TEST(Parser, MultipleValues) {
	const auto tree = parse("(;AB[pd][dp] [pp]\n[dd]AW[qq])");

	ASSERT_EQ(tree.nodes.size(), 1u);
	EXPECT_EQ(tree.nodes[0u].values("AB"), (std::vector<std::string>{"pd", "dp", "pp", "dd"}));
	EXPECT_EQ(tree.nodes[0u].values("AW"), std::vector<std::string>{"qq"});
}

TEST(Parser, RepeatedKeyIsMerged) {
	const auto tree = parse("(;AB[aa]AW[bb]AB[cc])");

	ASSERT_EQ(tree.nodes.size(), 1u);
	const auto& properties = tree.nodes[0u].properties();
	ASSERT_EQ(properties.size(), 2u);
	EXPECT_EQ(properties[0u].first, "AB");
	EXPECT_EQ(properties[0u].second, (std::vector<std::string>{"aa", "cc"}));
	EXPECT_EQ(properties[1u].first, "AW");
}

TEST(Parser, KeysAreUpperCased) {
	const auto tree = parse("(;sz[13]b[cc])");

	ASSERT_EQ(tree.nodes.size(), 1u);
	EXPECT_EQ(tree.nodes[0u].values("SZ").front(), "13");
	EXPECT_EQ(tree.nodes[0u].values("B").front(), "cc");
}

TEST(Parser, EscapedValues) {
	const auto tree = parse(R"((;C[a \] bracket]GN[back\\slash]PB[x\yz]))");

	ASSERT_EQ(tree.nodes.size(), 1u);
	EXPECT_EQ(tree.nodes[0u].values("C").front(), "a ] bracket");
	EXPECT_EQ(tree.nodes[0u].values("GN").front(), "back\\slash");
	EXPECT_EQ(tree.nodes[0u].values("PB").front(), "xyz");
}

TEST(Parser, EmptyValue) {
	const auto tree = parse("(;B[];W[])");

	ASSERT_EQ(tree.nodes.size(), 2u);
	EXPECT_EQ(tree.nodes[0u].values("B"), std::vector<std::string>{""});
	EXPECT_EQ(tree.nodes[1u].values("W"), std::vector<std::string>{""});
}

TEST(Parser, KeyWithoutValueIsDropped) {
	const auto tree = parse("(;GM[1]XX;B[aa])");

	ASSERT_EQ(tree.nodes.size(), 2u);
	EXPECT_FALSE(tree.nodes[0u].has("XX"));
	EXPECT_TRUE(tree.nodes[0u].has("GM"));
}

TEST(Parser, CarriageReturnsAreRemoved) {
	const auto tree = parse("(;C[line\r\nbreak]\r\n;B[aa]\r\n)");

	ASSERT_EQ(tree.nodes.size(), 2u);
	EXPECT_EQ(tree.nodes[0u].values("C").front(), "line\nbreak");
}

TEST(Parser, MainLineFollowsFirstBranch) {
	const auto tree = parse("(;SZ[9];B[aa](;W[bb];B[cc](;W[dd])(;W[ff]))(;W[ee]))");

	ASSERT_EQ(tree.nodes.size(), 5u);
	EXPECT_TRUE(tree.nodes[0u].has("SZ"));
	EXPECT_EQ(tree.nodes[1u].values("B").front(), "aa");
	EXPECT_EQ(tree.nodes[2u].values("W").front(), "bb");
	EXPECT_EQ(tree.nodes[3u].values("B").front(), "cc");
	EXPECT_EQ(tree.nodes[4u].values("W").front(), "dd");
}

TEST(Parser, SiblingBranchesAreSkipped) {
	const auto tree = parse("(;SZ[9](;B[aa])(;B[bb](;W[cc]))(;B[dd]))");

	ASSERT_EQ(tree.nodes.size(), 2u);
	EXPECT_EQ(tree.nodes[1u].values("B").front(), "aa");
}

TEST(Parser, NodesAfterBranchAreKept) {
	const auto tree = parse("(;SZ[9](;B[aa](;W[bb]));B[cc])");

	ASSERT_EQ(tree.nodes.size(), 4u);
	EXPECT_EQ(tree.nodes[3u].values("B").front(), "cc");
}

TEST(Parser, SecondGameIsIgnored) {
	const auto tree = parse("(;SZ[9];B[aa])(;SZ[13];B[bb])");

	ASSERT_EQ(tree.nodes.size(), 2u);
	EXPECT_EQ(tree.nodes[0u].values("SZ").front(), "9");
}

TEST(Parser, JunkIsTolerated) {
	const auto tree = parse("  \n(garbage;SZ[9]#;B[ee]@@ ;W[cc]!)trailing junk");

	ASSERT_EQ(tree.nodes.size(), 3u);
	EXPECT_EQ(tree.nodes[0u].values("SZ").front(), "9");
	EXPECT_EQ(tree.nodes[1u].values("B").front(), "ee");
	EXPECT_EQ(tree.nodes[2u].values("W").front(), "cc");
}

TEST(Parser, UnterminatedInput) {
	const auto tree = parse("(;SZ[9];B[ee];W[cc");

	ASSERT_EQ(tree.nodes.size(), 3u);
	EXPECT_EQ(tree.nodes[2u].values("W").front(), "cc");
}

TEST(Parser, EmptyTree) {
	EXPECT_TRUE(parse("()").nodes.empty());
	EXPECT_TRUE(parse("(").nodes.empty());
}

TEST(Parser, MissingTreeThrows) {
	EXPECT_THROW(parse(""), ParseError);
	EXPECT_THROW(parse("   \n "), ParseError);
	EXPECT_THROW(parse(";B[aa]"), ParseError);
	EXPECT_THROW(parse("x(;B[aa])"), ParseError);
}

TEST(Parser, Deterministic) {
	const std::string text = "(;GM[1]SZ[19]PB[Black]PW[White];B[pd];W[dp](;B[pp])(;B[dd]);B[qq])";

	const auto first  = parse(text);
	const auto second = parse(text);

	ASSERT_EQ(first.nodes.size(), second.nodes.size());
	for (std::size_t i = 0; i != first.nodes.size(); ++i) {
		EXPECT_EQ(first.nodes[i].properties(), second.nodes[i].properties());
	}
}

} // namespace kifu::gtest
