// Copyright (C) 2026 The apiref authors
//
// This program is free software; you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation; either version 3 of the License, or (at your option)
// any later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
// more details.
//
// You should have received a copy of the GNU General Public License along with
// this program; if not, write to the Free Software Foundation, Inc., 51
// Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA

#include "json.hpp"

#include <apiref/util/expected.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/string.hpp>

namespace {

struct ParseState
{
  std::string_view doc;
  size_t pos;

  bool
  at_end() const
  {
    return pos >= doc.size();
  }

  char
  peek() const
  {
    return doc[pos];
  }
};

void
skip_whitespace(ParseState& state)
{
  while (!state.at_end() && util::is_space(state.peek())) {
    ++state.pos;
  }
}

tl::expected<std::string, std::string>
parse_string(ParseState& state)
{
  if (state.at_end() || state.peek() != '"') {
    return tl::unexpected("Expected string");
  }
  ++state.pos; // Skip opening '"'

  std::string result;
  while (!state.at_end()) {
    char ch = state.peek();

    if (ch == '"') {
      ++state.pos; // Skip closing '"'
      return result;
    }

    if (ch == '\\') {
      ++state.pos;
      if (state.at_end()) {
        return tl::unexpected("Unexpected end of string");
      }

      char escaped = state.peek();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        result += escaped;
        break;
      case 'b':
        result += '\b';
        break;
      case 'f':
        result += '\f';
        break;
      case 'n':
        result += '\n';
        break;
      case 'r':
        result += '\r';
        break;
      case 't':
        result += '\t';
        break;
      case 'u':
        return tl::unexpected("\\uXXXX escape sequences are not supported");
      default:
        return tl::unexpected(FMT("Unknown escape sequence: \\{}", escaped));
      }
      ++state.pos;
    } else {
      result += ch;
      ++state.pos;
    }
  }

  return tl::unexpected("Unterminated string");
}

tl::expected<void, std::string>
skip_primitive(ParseState& state)
{
  // Numbers, true, false and null.
  const size_t start = state.pos;
  while (!state.at_end()) {
    char ch = state.peek();
    if (util::is_space(ch) || ch == ',' || ch == ':' || ch == '}' || ch == ']') {
      break;
    }
    ++state.pos;
  }
  const auto token = state.doc.substr(start, state.pos - start);
  if (token == "true" || token == "false" || token == "null") {
    return {};
  }
  if (token.find_first_not_of("+-.0123456789eE") == std::string_view::npos
      && token.find_first_of("0123456789") != std::string_view::npos) {
    return {};
  }
  return tl::unexpected(FMT("Invalid value: '{}'", token));
}

tl::expected<std::string, std::string> parse_member_key(ParseState& state);
tl::expected<void, std::string> skip_value(ParseState& state);

// Skip an object or array starting at the current position.
tl::expected<void, std::string>
skip_container(ParseState& state, char open, char close)
{
  if (state.at_end() || state.peek() != open) {
    return tl::unexpected(open == '{' ? "Expected object" : "Expected array");
  }
  ++state.pos;

  skip_whitespace(state);
  if (!state.at_end() && state.peek() == close) {
    ++state.pos;
    return {};
  }

  while (true) {
    skip_whitespace(state);
    if (open == '{') {
      TRY(parse_member_key(state));
    }
    TRY(skip_value(state));
    skip_whitespace(state);

    if (state.at_end()) {
      return tl::unexpected(open == '{' ? "Unterminated object"
                                        : "Unterminated array");
    }
    if (state.peek() == close) {
      ++state.pos;
      return {};
    }
    if (state.peek() != ',') {
      return tl::unexpected(FMT("Expected ',' or '{}'", close));
    }
    ++state.pos;
  }
}

tl::expected<void, std::string>
skip_value(ParseState& state)
{
  if (state.at_end()) {
    return tl::unexpected("Unexpected end of document");
  }

  char ch = state.peek();
  if (ch == '"') {
    TRY(parse_string(state));
  } else if (ch == '{') {
    TRY(skip_container(state, '{', '}'));
  } else if (ch == '[') {
    TRY(skip_container(state, '[', ']'));
  } else if (ch == 't' || ch == 'f' || ch == 'n' || ch == '-'
             || util::is_digit(ch)) {
    TRY(skip_primitive(state));
  } else {
    return tl::unexpected(FMT("Unexpected character: '{}'", ch));
  }
  return {};
}

// Check that the whole document is a single well-formed value.
tl::expected<void, std::string>
validate_document(std::string_view document)
{
  ParseState state{document, 0};
  skip_whitespace(state);
  TRY(skip_value(state));
  skip_whitespace(state);
  if (!state.at_end()) {
    return tl::unexpected("Unexpected content after document");
  }
  return {};
}

// Parse the "key": prefix of an object member. The position must be at the
// opening quote of the key.
tl::expected<std::string, std::string>
parse_member_key(ParseState& state)
{
  if (state.at_end() || state.peek() != '"') {
    return tl::unexpected("Expected string key");
  }
  TRY_ASSIGN(auto key, parse_string(state));

  skip_whitespace(state);
  if (state.at_end() || state.peek() != ':') {
    return tl::unexpected("Expected ':' after key");
  }
  ++state.pos; // Skip ':'
  skip_whitespace(state);
  return key;
}

tl::expected<void, std::string>
navigate_to_key(ParseState& state, std::string_view key)
{
  if (state.at_end() || state.peek() != '{') {
    return tl::unexpected("Expected object");
  }
  ++state.pos; // Skip '{'

  while (true) {
    skip_whitespace(state);

    if (state.at_end() || state.peek() == '}') {
      return tl::unexpected(FMT("Key '{}' not found", key));
    }

    TRY_ASSIGN(const auto current_key, parse_member_key(state));
    if (current_key == key) {
      return {}; // Found the key, state.pos is now at the value
    }

    TRY(skip_value(state));

    skip_whitespace(state);
    if (!state.at_end() && state.peek() == ',') {
      ++state.pos;
    }
  }
}

tl::expected<util::SimpleJsonParser::StringPairs, std::string>
parse_string_members(ParseState& state)
{
  if (state.at_end() || state.peek() != '{') {
    return tl::unexpected("Expected object");
  }
  ++state.pos; // Skip '{'

  util::SimpleJsonParser::StringPairs result;

  while (true) {
    skip_whitespace(state);

    if (state.at_end()) {
      return tl::unexpected("Unterminated object");
    }

    if (state.peek() == '}') {
      ++state.pos; // Skip '}'
      return result;
    }

    TRY_ASSIGN(auto key, parse_member_key(state));
    if (state.at_end() || state.peek() != '"') {
      return tl::unexpected(FMT("Expected string value for key '{}'", key));
    }
    TRY_ASSIGN(auto value, parse_string(state));
    result.emplace_back(std::move(key), std::move(value));

    skip_whitespace(state);

    if (state.at_end()) {
      return tl::unexpected("Unterminated object");
    }

    if (state.peek() == ',') {
      ++state.pos; // Skip comma
    } else if (state.peek() != '}') {
      return tl::unexpected("Expected ',' or '}' in object");
    }
  }
}

// Position `state` at the value that `filter` refers to.
tl::expected<void, std::string>
navigate_to_filter(ParseState& state, std::string_view filter)
{
  if (filter.empty() || filter[0] != '.') {
    return tl::unexpected("Invalid filter: must start with '.'");
  }

  // Parse filter path, e.g. ".Data.Packages" -> ["Data", "Packages"].
  auto path = util::split_into_views(filter.substr(1), ".");
  if (path.empty()) {
    return tl::unexpected("Empty filter path");
  }

  skip_whitespace(state);
  if (state.at_end() || state.peek() != '{') {
    return tl::unexpected("Expected object at root");
  }

  for (size_t i = 0; i < path.size(); ++i) {
    TRY(navigate_to_key(state, path[i]));
    skip_whitespace(state);
    if (i + 1 < path.size() && (state.at_end() || state.peek() != '{')) {
      return tl::unexpected(FMT("Expected object for key '{}'", path[i]));
    }
  }
  return {};
}

} // namespace

namespace util {

SimpleJsonParser::SimpleJsonParser(std::string_view document)
  : m_document(document)
{
}

tl::expected<SimpleJsonParser::StringPairs, std::string>
SimpleJsonParser::get_string_members(std::string_view filter) const
{
  TRY(validate_document(m_document));
  ParseState state{m_document, 0};
  TRY(navigate_to_filter(state, filter));
  if (state.at_end() || state.peek() != '{') {
    return tl::unexpected(FMT("Expected object for filter '{}'", filter));
  }
  return parse_string_members(state);
}

} // namespace util
