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

#include <apiref/core/exceptions.hpp>
#include <apiref/core/projectfile.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>

#include <doctest/doctest.h>

using TestUtil::TestContext;

namespace fs = util::filesystem;

TEST_SUITE_BEGIN("core::ProjectFile");

TEST_CASE("Load items with metadata")
{
  TestContext test_context;

  REQUIRE(util::write_file("app.apiproj",
                           "# Project\n"
                           "Name = app\n"
                           "OpenApiReference = openapi/a.json\n"
                           "  SourceUrl = https://example.com/a.json\n"
                           "  # a comment\n"
                           "  CodeGenerator = NSwagCSharp\n"
                           "\n"
                           "OpenApiReference = openapi/b.json\n"));

  auto project = core::ProjectFile::load("app.apiproj");
  auto items = project.get_items("OpenApiReference");
  REQUIRE(items.size() == 2);
  CHECK(items[0].include == "openapi/a.json");
  REQUIRE(items[0].metadata.size() == 2);
  CHECK(items[0].metadata_value("SourceUrl") == "https://example.com/a.json");
  CHECK(items[0].metadata_value("CodeGenerator") == "NSwagCSharp");
  CHECK(!items[0].metadata_value("Other"));
  CHECK(items[1].include == "openapi/b.json");
  CHECK(items[1].metadata.empty());

  CHECK(project.get_items("Name").size() == 1);
  CHECK(project.get_items("OpenApiProjectReference").empty());
}

TEST_CASE("Add item preserves existing text")
{
  TestContext test_context;

  REQUIRE(util::write_file("app.apiproj", "# Project\nName = app"));

  auto project = core::ProjectFile::load("app.apiproj");
  project.add_item("OpenApiReference",
                   "openapi/openapi.json",
                   {{"SourceUrl", "https://example.com/openapi.json"}});

  CHECK(*util::read_file("app.apiproj")
        == "# Project\n"
           "Name = app\n"
           "OpenApiReference = openapi/openapi.json\n"
           "  SourceUrl = https://example.com/openapi.json\n");

  auto reloaded = core::ProjectFile::load("app.apiproj");
  auto items = reloaded.get_items("OpenApiReference");
  REQUIRE(items.size() == 1);
  CHECK(items[0].metadata_value("SourceUrl")
        == "https://example.com/openapi.json");
}

TEST_CASE("Reload picks up changes made by others")
{
  TestContext test_context;

  REQUIRE(util::write_file("app.apiproj", "# Project\n"));
  auto project = core::ProjectFile::load("app.apiproj");
  REQUIRE(util::write_file("app.apiproj",
                           "# Project\nPackageReference = A\n  Version = 1\n"));

  project.reload();
  CHECK(project.get_items("PackageReference").size() == 1);
  project.add_item("OpenApiReference", "a.json", {});
  CHECK(*util::read_file("app.apiproj")
        == "# Project\nPackageReference = A\n  Version = 1\n"
           "OpenApiReference = a.json\n");
}

TEST_CASE("Remove items")
{
  TestContext test_context;

  REQUIRE(util::write_file("app.apiproj",
                           "# Project\n"
                           "OpenApiReference = a.json\n"
                           "  SourceUrl = https://example.com/a.json\n"
                           "# Keep me\n"
                           "OpenApiReference = b.json\n"
                           "OpenApiReference = c.json\n"
                           "  SourceUrl = https://example.com/c.json\n"));

  auto project = core::ProjectFile::load("app.apiproj");

  SUBCASE("Matching items")
  {
    const auto removed = project.remove_items(
      "OpenApiReference",
      [](const core::ProjectItem& item) { return item.include != "b.json"; });
    REQUIRE(removed.size() == 2);
    CHECK(removed[0].include == "a.json");
    CHECK(removed[1].include == "c.json");

    CHECK(*util::read_file("app.apiproj")
          == "# Project\n"
             "# Keep me\n"
             "OpenApiReference = b.json\n");
    CHECK(project.get_items("OpenApiReference").size() == 1);
  }

  SUBCASE("No match leaves file untouched")
  {
    const auto removed = project.remove_items(
      "OpenApiProjectReference",
      [](const core::ProjectItem&) { return true; });
    CHECK(removed.empty());
    CHECK(project.get_items("OpenApiReference").size() == 3);
  }
}

TEST_CASE("Parse errors")
{
  TestContext test_context;

  SUBCASE("Missing equal sign")
  {
    REQUIRE(util::write_file("app.apiproj", "OpenApiReference\n"));
    CHECK_THROWS_WITH(core::ProjectFile::load("app.apiproj"),
                      "app.apiproj:1: missing equal sign");
  }

  SUBCASE("Missing include path")
  {
    REQUIRE(util::write_file("app.apiproj", "OpenApiReference =\n"));
    CHECK_THROWS_WITH(
      core::ProjectFile::load("app.apiproj"),
      "app.apiproj:1: missing include path for OpenApiReference");
  }

  SUBCASE("Missing equal sign in metadata")
  {
    REQUIRE(util::write_file("app.apiproj",
                             "OpenApiReference = a.json\n  SourceUrl\n"));
    CHECK_THROWS_WITH(core::ProjectFile::load("app.apiproj"),
                      "app.apiproj:2: missing equal sign in metadata");
  }

  SUBCASE("Missing file")
  {
    CHECK_THROWS_AS(core::ProjectFile::load("missing.apiproj"), core::Error);
  }
}

TEST_CASE("core::resolve_project_file")
{
  TestContext test_context;

  const auto cwd = *fs::current_path();

  SUBCASE("No project")
  {
    CHECK_THROWS_WITH_AS(
      core::resolve_project_file(std::nullopt, cwd, ".apiproj"),
      "No project files were found in the current directory. Either move to a"
      " new directory or provide the project explicitly",
      core::ValidationError);
  }

  SUBCASE("Single project")
  {
    REQUIRE(util::write_file("app.apiproj", ""));
    REQUIRE(util::write_file("README", ""));
    CHECK(core::resolve_project_file(std::nullopt, cwd, ".apiproj")
          == cwd / "app.apiproj");
  }

  SUBCASE("Several projects")
  {
    REQUIRE(util::write_file("a.apiproj", ""));
    REQUIRE(util::write_file("b.apiproj", ""));
    CHECK_THROWS_WITH_AS(
      core::resolve_project_file(std::nullopt, cwd, ".apiproj"),
      "More than one project was found in this directory, either remove a"
      " duplicate or explicitly provide the project.",
      core::ValidationError);
  }

  SUBCASE("Explicit project")
  {
    REQUIRE(util::write_file("a.apiproj", ""));
    REQUIRE(util::write_file("b.apiproj", ""));
    CHECK(core::resolve_project_file(std::string("b.apiproj"), cwd, ".apiproj")
          == cwd / "b.apiproj");
    CHECK_THROWS_AS(
      core::resolve_project_file(std::string("c.apiproj"), cwd, ".apiproj"),
      core::ValidationError);
  }
}

TEST_SUITE_END();
