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

#include <apiref/core/dependencyinstaller.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>

#include <doctest/doctest.h>

#include <sys/stat.h>

#include <chrono>

using TestUtil::TestContext;

namespace fs = util::filesystem;

namespace {

void
write_script(const std::string& name, const std::string& body)
{
  REQUIRE(util::write_file(name, FMT("#!/bin/sh\n{}", body)));
  REQUIRE(chmod(name.c_str(), 0755) == 0);
}

} // namespace

TEST_SUITE_BEGIN("core::ProcessDependencyInstaller");

TEST_CASE("Packages are added one at a time in the project directory")
{
  TestContext test_context;

  const auto cwd = *fs::current_path();
  REQUIRE(fs::create_directories("project"));
  write_script("fake-dotnet", "echo \"$(pwd -P) $*\" >> ../calls.txt\n");

  core::ProcessDependencyInstaller installer(
    (cwd / "fake-dotnet").string(), cwd / "project", std::chrono::seconds(10));
  const core::PackageMap packages{{"NSwag.ApiDescription.Client", "13.0.5"},
                                  {"Newtonsoft.Json", "12.0.2"}};
  REQUIRE(installer.install(packages));

  const auto project_dir = *fs::canonical("project");
  CHECK(*util::read_file("calls.txt")
        == FMT("{0} add package Newtonsoft.Json --version 12.0.2 --no-restore\n"
               "{0} add package NSwag.ApiDescription.Client --version 13.0.5"
               " --no-restore\n",
               project_dir));
}

TEST_CASE("Failing command")
{
  TestContext test_context;

  const auto cwd = *fs::current_path();
  write_script("fake-dotnet",
               "echo \"adding $3\"\necho \"error: no such package\" >&2\n"
               "exit 1\n");

  core::ProcessDependencyInstaller installer(
    (cwd / "fake-dotnet").string(), cwd, std::chrono::seconds(10));
  const auto result = installer.install({{"Missing.Package", "1.0.0"}});
  REQUIRE(!result);
  CHECK(result.error().message
        == FMT("Could not add package `Missing.Package` to `{}`", cwd));
  CHECK(result.error().stdout_data == "adding Missing.Package\n");
  CHECK(result.error().stderr_data == "error: no such package\n");
}

TEST_CASE("Slow command")
{
  TestContext test_context;

  const auto cwd = *fs::current_path();
  write_script("fake-dotnet", "exec sleep 10\n");

  core::ProcessDependencyInstaller installer(
    (cwd / "fake-dotnet").string(), cwd, std::chrono::seconds(1));
  const auto result = installer.install({{"Slow.Package", "1.0.0"}});
  REQUIRE(!result);
  CHECK(result.error().message
        == FMT("Adding package `Slow.Package` to `{}` took longer than 1"
               " seconds.",
               cwd));
}

TEST_CASE("Hung command with closed output")
{
  TestContext test_context;

  const auto cwd = *fs::current_path();
  write_script("fake-dotnet", "exec 1>&- 2>&-\nexec sleep 10\n");

  core::ProcessDependencyInstaller installer(
    (cwd / "fake-dotnet").string(), cwd, std::chrono::seconds(1));
  const auto start = std::chrono::steady_clock::now();
  const auto result = installer.install({{"Hung.Package", "1.0.0"}});
  REQUIRE(!result);
  CHECK(result.error().message
        == FMT("Adding package `Hung.Package` to `{}` took longer than 1"
               " seconds.",
               cwd));
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("Command leaving a background process behind")
{
  TestContext test_context;

  const auto cwd = *fs::current_path();
  write_script("fake-dotnet", "sleep 3 &\nexit 0\n");

  core::ProcessDependencyInstaller installer(
    (cwd / "fake-dotnet").string(), cwd, std::chrono::seconds(1));
  CHECK(installer.install({{"Server.Package", "1.0.0"}}));
}

TEST_CASE("Command not found on the path")
{
  TestContext test_context;

  core::ProcessDependencyInstaller installer(
    "apiref-no-such-command", *fs::current_path(), std::chrono::seconds(1));
  const auto result = installer.install({{"A", "1"}});
  REQUIRE(!result);
  CHECK(result.error().message
        == "apiref-no-such-command was not found on the path.");
}

TEST_SUITE_END();
