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

#include <apiref/util/configreader.hpp>

#include <doctest/doctest.h>

#include <string>

using util::ConfigReader;

TEST_SUITE_BEGIN("util::ConfigReader");

TEST_CASE("Simple key/value pairs")
{
  ConfigReader reader("a = 1\n# comment\n\nb=2\n");

  auto item = reader.read_next_item();
  REQUIRE(item);
  REQUIRE(*item);
  CHECK((*item)->line_number == 1);
  CHECK((*item)->key == "a");
  CHECK((*item)->value == "1");

  item = reader.read_next_item();
  REQUIRE(item);
  REQUIRE(*item);
  CHECK((*item)->line_number == 4);
  CHECK((*item)->key == "b");
  CHECK((*item)->value == "2");

  item = reader.read_next_item();
  REQUIRE(item);
  CHECK(!*item);
}

TEST_CASE("Continuation lines")
{
  ConfigReader reader(
    "key = first\n  second\n# comment\n\n  third\nother = x\n");

  auto item = reader.read_next_item();
  REQUIRE(item);
  REQUIRE(*item);
  CHECK((*item)->key == "key");
  CHECK((*item)->value == "first second third");

  item = reader.read_next_item();
  REQUIRE(item);
  REQUIRE(*item);
  CHECK((*item)->key == "other");
}

TEST_CASE("Raw item positions")
{
  const std::string text = "# header\nTag = value\n  Meta = x\n\n# trailer\n";
  ConfigReader reader(text);

  auto item = reader.read_next_raw_item();
  REQUIRE(item);
  REQUIRE(*item);
  const auto& raw = **item;
  CHECK(raw.line_number == 2);
  CHECK(raw.key == "Tag");
  CHECK(text.substr(raw.line_start_pos, 3) == "Tag");
  // Trailing blank and comment lines are not part of the value.
  CHECK(text.substr(raw.value_start_pos, raw.value_length)
        == "value\n  Meta = x");
}

TEST_CASE("Empty value")
{
  ConfigReader reader("key =\nnext = 1\n");

  auto item = reader.read_next_item();
  REQUIRE(item);
  REQUIRE(*item);
  CHECK((*item)->key == "key");
  CHECK((*item)->value.empty());
}

TEST_CASE("Errors")
{
  SUBCASE("Indented key")
  {
    ConfigReader reader("  key = value\n");
    auto item = reader.read_next_item();
    REQUIRE(!item);
    CHECK(item.error().line_number == 1);
    CHECK(item.error().message == "indented key");
  }

  SUBCASE("Missing equal sign")
  {
    ConfigReader reader("a = 1\nno equal sign\n");
    auto item = reader.read_next_item();
    REQUIRE(!item);
    CHECK(item.error().line_number == 2);
    CHECK(item.error().message == "missing equal sign");
  }
}

TEST_SUITE_END();
