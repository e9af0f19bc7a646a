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

#include <apiref/util/environment.hpp>

#include <doctest/doctest.h>

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

TEST_SUITE_BEGIN("util");

TEST_CASE("util::getenv_path")
{
  util::unsetenv("APIREF_TEST_VAR");
  CHECK(!util::getenv_path("APIREF_TEST_VAR"));

  util::setenv("APIREF_TEST_VAR", "/tmp/x");
  CHECK(util::getenv_path("APIREF_TEST_VAR") == fs::path("/tmp/x"));
  util::unsetenv("APIREF_TEST_VAR");
}

TEST_CASE("util::getenv_path_list")
{
  SUBCASE("unset")
  {
    util::unsetenv("test");
    std::vector<fs::path> expected;
    CHECK(util::getenv_path_list("test") == expected);
  }

  SUBCASE("empty")
  {
    util::setenv("test", "");
    std::vector<fs::path> expected = {};
    CHECK(util::getenv_path_list("test") == expected);
  }

  SUBCASE("delimiters")
  {
    util::setenv("test", "::");
    std::vector<fs::path> expected = {};
    CHECK(util::getenv_path_list("test") == expected);
  }

  SUBCASE("multiple")
  {
    util::setenv("test", "/foo:/bar");
    std::vector<fs::path> expected = {"/foo", "/bar"};
    CHECK(util::getenv_path_list("test") == expected);
  }

  SUBCASE("delimiters around")
  {
    util::setenv("test", ":/foo:");
    std::vector<fs::path> expected = {"/foo"};
    CHECK(util::getenv_path_list("test") == expected);
  }

  util::unsetenv("test");
}

TEST_SUITE_END();
