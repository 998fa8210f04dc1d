#include "sgf/parser.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>

namespace kifu {

void SgfNode::add(std::string key, std::vector<std::string> values) {
	auto it = std::find_if(m_properties.begin(), m_properties.end(), [&](const Property& p) { return p.first == key; });
	if (it == m_properties.end()) {
		m_properties.emplace_back(std::move(key), std::move(values));
		return;
	}

	it->second.insert(it->second.end(), std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()));
}

bool SgfNode::has(std::string_view key) const {
	return std::any_of(m_properties.begin(), m_properties.end(), [&](const Property& p) { return p.first == key; });
}

const std::vector<std::string>& SgfNode::values(std::string_view key) const {
	static const std::vector<std::string> none{};

	auto it = std::find_if(m_properties.begin(), m_properties.end(), [&](const Property& p) { return p.first == key; });
	return it == m_properties.end() ? none : it->second;
}

const std::vector<SgfNode::Property>& SgfNode::properties() const {
	return m_properties;
}

bool SgfNode::empty() const {
	return m_properties.empty();
}


//! Single pass scanner over the normalized record text.
class SgfScanner {
public:
	SgfScanner(std::string text) : m_text(std::move(text)) {
	}

	SgfTree run();

private:
	void parseTree();              //!< Collect main line nodes. Cursor on the outer '('.
	SgfNode parseNode();           //!< Cursor after ';'.
	std::string parseIdentifier(); //!< Cursor on the first letter.
	std::string parseValue();      //!< Cursor on '['.
	void skipVariation();          //!< Cursor on '('.
	void skipWhitespace();

	bool atEnd() const {
		return m_pos >= m_text.size();
	}
	char peek() const {
		return m_text[m_pos];
	}

private:
	std::string m_text;
	std::size_t m_pos{0u};
	std::size_t m_skippedJunk{0u};
	std::size_t m_skippedVariations{0u};

	SgfTree m_tree{};
};

SgfTree SgfScanner::run() {
	skipWhitespace();
	if (atEnd() || peek() != '(') {
		throw ParseError("Missing '(' at start of record");
	}

	parseTree();

	if (m_skippedJunk != 0u || m_skippedVariations != 0u) {
		sgf::Logger().Log(Logging::LogLevel::Debug, std::format("[Parser] Skipped {} junk characters and {} variations.", m_skippedJunk, m_skippedVariations));
	}
	return std::move(m_tree);
}

void SgfScanner::parseTree() {
	// One entry per open tree level. True once the first branch of the level was entered.
	std::vector<bool> levels{false};
	++m_pos; // '('
	skipWhitespace();

	while (!atEnd() && !levels.empty()) {
		const char c = peek();
		if (c == ';') {
			++m_pos;
			m_tree.nodes.push_back(parseNode());
		} else if (c == '(') {
			if (!levels.back()) {
				// First branch continues the main line.
				levels.back() = true;
				levels.push_back(false);
				++m_pos;
			} else {
				skipVariation();
			}
		} else if (c == ')') {
			levels.pop_back();
			++m_pos;
		} else {
			++m_pos;
			++m_skippedJunk;
		}
		skipWhitespace();
	}
}

SgfNode SgfScanner::parseNode() {
	SgfNode node;

	skipWhitespace();
	while (!atEnd() && std::isalpha(static_cast<unsigned char>(peek()))) {
		auto key = parseIdentifier();

		std::vector<std::string> values;
		skipWhitespace();
		while (!atEnd() && peek() == '[') {
			values.push_back(parseValue());
			skipWhitespace();
		}

		// Keys without value carry no information.
		if (!values.empty()) {
			node.add(std::move(key), std::move(values));
		}
		skipWhitespace();
	}

	return node;
}

std::string SgfScanner::parseIdentifier() {
	std::string key;
	while (!atEnd() && std::isalpha(static_cast<unsigned char>(peek()))) {
		key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(peek()))));
		++m_pos;
	}
	return key;
}

std::string SgfScanner::parseValue() {
	++m_pos; // '['

	std::string value;
	while (!atEnd()) {
		const char c = peek();
		++m_pos;

		if (c == '\\') {
			if (!atEnd()) {
				value.push_back(peek());
				++m_pos;
			}
		} else if (c == ']') {
			break;
		} else {
			value.push_back(c);
		}
	}
	return value;
}

void SgfScanner::skipVariation() {
	++m_pos; // '('
	++m_skippedVariations;

	std::size_t depth = 0u;
	while (!atEnd()) {
		const char c = peek();
		++m_pos;

		if (c == '(') {
			++depth;
		} else if (c == ')') {
			if (depth == 0u) {
				break;
			}
			--depth;
		}
	}
}

void SgfScanner::skipWhitespace() {
	while (!atEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
		++m_pos;
	}
}


SgfTree parse(std::string_view text) {
	std::string normalized;
	normalized.reserve(text.size());
	std::copy_if(text.begin(), text.end(), std::back_inserter(normalized), [](char c) { return c != '\r'; });

	return SgfScanner(std::move(normalized)).run();
}

} // namespace kifu
