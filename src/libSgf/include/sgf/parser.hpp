#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kifu {

//! Thrown when the record does not start with a game tree.
class ParseError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! One SGF node. Properties keep their order of appearance.
class SgfNode {
public:
	using Property = std::pair<std::string, std::vector<std::string>>; //!< Upper case key and raw values.

public:
	//! Add values to a property. Values of a key already present are appended to it.
	void add(std::string key, std::vector<std::string> values);

	bool has(std::string_view key) const;

	//! Values of the property or an empty list.
	const std::vector<std::string>& values(std::string_view key) const;

	const std::vector<Property>& properties() const;

	bool empty() const;

private:
	std::vector<Property> m_properties{};
};

//! Main line of a game record.
struct SgfTree {
	std::vector<SgfNode> nodes;
};

//! Parse sgf text into the sequence of main line nodes.
//! The main line follows the first branch of every tree. Other branches are skipped and lost.
//! \note Junk characters between tokens are skipped. Only a missing outer '(' is an error.
//! \throws ParseError
SgfTree parse(std::string_view text);

} // namespace kifu
