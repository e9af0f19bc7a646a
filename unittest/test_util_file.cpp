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

#include "testutil.hpp"

#include <apiref/util/fd.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>

#include <doctest/doctest.h>

#include <fcntl.h>
#include <unistd.h>

#include <string>

using TestUtil::TestContext;

namespace fs = util::filesystem;

TEST_SUITE_BEGIN("util");

TEST_CASE("util::read_file and util::write_file")
{
  TestContext test_context;

  CHECK(util::write_file("test", "foo\nbar\n"));
  CHECK(*util::read_file("test") == "foo\nbar\n");

  const std::string binary("\x00\x01\xff\n", 4);
  CHECK(util::write_file("binary", binary));
  CHECK(*util::read_file("binary") == binary);

  const auto missing = util::read_file("missing");
  REQUIRE(!missing);
  CHECK(missing.error() == "No such file or directory");
}

TEST_CASE("util::write_file modes")
{
  TestContext test_context;

  CHECK(util::write_file("test", "foo"));
  CHECK(link("test", "test2") == 0);

  SUBCASE("WriteFileMode::unlink")
  {
    CHECK(util::write_file("test", "bar", util::WriteFileMode::unlink));
    CHECK(*util::read_file("test2") == "foo");
  }

  SUBCASE("WriteFileMode::in_place")
  {
    CHECK(util::write_file("test", "bar", util::WriteFileMode::in_place));
    CHECK(*util::read_file("test2") == "bar");
  }

  SUBCASE("WriteFileMode::exclusive")
  {
    auto result =
      util::write_file("test", "bar", util::WriteFileMode::exclusive);
    CHECK(result.error() == "File exists");
    CHECK(util::write_file("test3", "bar", util::WriteFileMode::exclusive));
    CHECK(*util::read_file("test3") == "bar");
  }
}

TEST_CASE("util::read_fd")
{
  TestContext test_context;

  const std::string content(100000, 'x');
  REQUIRE(util::write_file("test", content));

  util::Fd fd(open("test", O_RDONLY));
  REQUIRE(fd);
  std::string read_back;
  REQUIRE(util::read_fd(*fd, [&](auto data) {
    read_back.append(reinterpret_cast<const char*>(data.data()), data.size());
  }));
  CHECK(read_back == content);
}

TEST_CASE("util::remove")
{
  TestContext test_context;

  REQUIRE(util::write_file("test", "x"));
  const auto removed = util::remove("test");
  REQUIRE(removed);
  CHECK(*removed);
  CHECK(!fs::exists("test"));

  const auto missing = util::remove("test");
  REQUIRE(missing);
  CHECK(!*missing);
}

TEST_SUITE_END();
