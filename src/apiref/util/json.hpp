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

#pragma once

#include <tl/expected.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util {

// Simple JSON parser that is tailored for reading small documents of nested
// objects with string values, such as the package version document.
//
// Does not support \uXXXX escapes and lots of other things.
class SimpleJsonParser
{
public:
  using StringPairs = std::vector<std::pair<std::string, std::string>>;

  explicit SimpleJsonParser(std::string_view document);

  // Extract all members of an object whose values are strings, in document
  // order. `filter` is a jq-like filter (e.g. ".Packages") that locates the
  // object; only nested objects are supported. Duplicate keys are kept. Fails
  // unless the whole document is well-formed.
  tl::expected<StringPairs, std::string>
  get_string_members(std::string_view filter) const;

private:
  std::string_view m_document;
};

} // namespace util
