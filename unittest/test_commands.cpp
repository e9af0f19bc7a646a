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

#include <apiref/commands.hpp>
#include <apiref/config.hpp>
#include <apiref/core/exceptions.hpp>
#include <apiref/core/mainoptions.hpp>
#include <apiref/core/projectfile.hpp>
#include <apiref/util/environment.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>

#include <doctest/doctest.h>

#include <cstdlib>
#include <vector>

using TestUtil::TestContext;

namespace fs = util::filesystem;

namespace {

const char k_project_text[] =
  "# Client\n"
  "OpenApiReference = openapi/openapi.json\n"
  "  SourceUrl = https://example.com/openapi.json\n"
  "  CodeGenerator = NSwagCSharp\n"
  "OpenApiReference = local.json\n"
  "  CodeGenerator = NSwagCSharp\n"
  "OpenApiProjectReference = ../server/server.apiproj\n"
  "  SourceProject = /src/server/server.apiproj\n";

int
run_main(std::vector<const char*> args)
{
  args.insert(args.begin(), "apiref");
  args.push_back(nullptr);
  return core::process_main_options(static_cast<int>(args.size() - 1),
                                    args.data());
}

} // namespace

TEST_SUITE_BEGIN("commands");

TEST_CASE("remove_reference")
{
  TestContext test_context;

  REQUIRE(util::write_file("client.apiproj", k_project_text));
  REQUIRE(fs::create_directories("openapi"));
  REQUIRE(util::write_file("openapi/openapi.json", "{}"));
  REQUIRE(util::write_file("local.json", "{}"));

  Config config;
  CommandOptions options;

  SUBCASE("URL reference and its document")
  {
    CHECK(remove_reference(config, "https://example.com/openapi.json", options)
          == EXIT_SUCCESS);
    CHECK(!fs::exists("openapi/openapi.json"));
    auto project = core::ProjectFile::load("client.apiproj");
    CHECK(project.get_items("OpenApiReference").size() == 1);
    CHECK(project.get_items("OpenApiProjectReference").size() == 1);
  }

  SUBCASE("File reference keeps the file")
  {
    CHECK(remove_reference(config, "local.json", options) == EXIT_SUCCESS);
    CHECK(fs::exists("local.json"));
    auto project = core::ProjectFile::load("client.apiproj");
    const auto items = project.get_items("OpenApiReference");
    REQUIRE(items.size() == 1);
    CHECK(items[0].include == "openapi/openapi.json");
  }

  SUBCASE("Project reference")
  {
    CHECK(remove_reference(config, "/src/server/server.apiproj", options)
          == EXIT_SUCCESS);
    auto project = core::ProjectFile::load("client.apiproj");
    CHECK(project.get_items("OpenApiProjectReference").empty());
    CHECK(project.get_items("OpenApiReference").size() == 2);
  }

  SUBCASE("No match")
  {
    CHECK(remove_reference(config, "other.json", options) == EXIT_SUCCESS);
    CHECK(*util::read_file("client.apiproj") == k_project_text);
  }

  SUBCASE("Explicit project")
  {
    REQUIRE(fs::create_directories("sub"));
    REQUIRE(util::write_file("sub/other.apiproj", ""));
    options.project = "client.apiproj";
    CHECK(remove_reference(config, "local.json", options) == EXIT_SUCCESS);
    CHECK(core::ProjectFile::load("client.apiproj")
            .get_items("OpenApiReference")
            .size()
          == 1);
  }
}

TEST_CASE("refresh_reference validation")
{
  TestContext test_context;

  REQUIRE(util::write_file("client.apiproj", k_project_text));
  Config config;
  CommandOptions options;

  CHECK_THROWS_WITH_AS(
    refresh_reference(config, "local.json", options),
    "local.json was not valid. Valid values are URLs",
    core::ValidationError);
  CHECK_THROWS_AS(
    refresh_reference(config, "https://example.com/unknown.json", options),
    core::ValidationError);
}

TEST_CASE("add_reference without project")
{
  TestContext test_context;

  Config config;
  CHECK_THROWS_AS(add_reference(config,
                                core::SourceKind::url,
                                "https://example.com/openapi.json",
                                CommandOptions()),
                  core::ValidationError);
}

TEST_CASE("core::process_main_options")
{
  TestContext test_context;

  util::setenv("APIREF_CONFIGPATH", "apiref.conf");

  SUBCASE("version and help")
  {
    CHECK(run_main({"--version"}) == EXIT_SUCCESS);
    CHECK(run_main({"-h"}) == EXIT_SUCCESS);
  }

  SUBCASE("usage errors")
  {
    CHECK(run_main({}) == EXIT_FAILURE);
    CHECK(run_main({"--no-such-option"}) == EXIT_FAILURE);
    CHECK(run_main({"add"}) == EXIT_FAILURE);
    CHECK(run_main({"add", "url"}) == EXIT_FAILURE);
    CHECK(run_main({"remove"}) == EXIT_FAILURE);
    CHECK_THROWS_WITH_AS(run_main({"frobnicate"}),
                         "unknown command \"frobnicate\"",
                         core::ValidationError);
    CHECK_THROWS_WITH_AS(run_main({"add", "thing", "x"}),
                         "unknown add command \"thing\"",
                         core::ValidationError);
    CHECK_THROWS_WITH_AS(run_main({"remove", "a", "b"}),
                         "unexpected argument \"b\"",
                         core::ValidationError);
    CHECK_THROWS_WITH_AS(
      run_main({"add", "file", "a.json", "--output-file", "b.json"}),
      "--output-file is only valid for add url",
      core::ValidationError);
  }

  SUBCASE("set and show configuration")
  {
    CHECK(run_main({"--set-config", "install_timeout=45", "--show-config"})
          == EXIT_SUCCESS);
    CHECK(*util::read_file("apiref.conf") == "install_timeout = 45\n");
    CHECK_THROWS_WITH_AS(run_main({"--set-config", "install_timeout"}),
                         "missing equal sign in \"install_timeout\"",
                         core::Error);
  }

  SUBCASE("remove with options after the argument")
  {
    REQUIRE(util::write_file("client.apiproj", k_project_text));
    REQUIRE(util::write_file("local.json", "{}"));
    CHECK(run_main({"remove", "local.json", "-p", "client.apiproj"})
          == EXIT_SUCCESS);
    CHECK(core::ProjectFile::load("client.apiproj")
            .get_items("OpenApiReference")
            .size()
          == 1);
  }

  util::unsetenv("APIREF_CONFIGPATH");
}

TEST_SUITE_END();
