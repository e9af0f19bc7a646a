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
#include <apiref/core/packageresolver.hpp>
#include <apiref/core/packagetable.hpp>

#include <doctest/doctest.h>

using core::CodeGenerator;
using core::PackageMap;
using TestUtil::FakeDownloader;

namespace {

const std::string k_url = "https://example.com/package-versions.json";

core::PackageTable
make_table()
{
  return core::PackageTable({{"Microsoft.Extensions.ApiDescription.Client",
                              "3.0.0"},
                             {"Newtonsoft.Json", "12.0.2"},
                             {"NSwag.ApiDescription.Client", "13.0.5"}},
                            {{"Microsoft.Extensions.ApiDescription.Client",
                              "3.0.0"},
                             {"NSwag.ApiDescription.Client", "13.0.5"}});
}

} // namespace

TEST_SUITE_BEGIN("core::PackageVersionResolver");

TEST_CASE("Built-in table")
{
  const auto table = make_table();
  FakeDownloader downloader;

  SUBCASE("Unreachable document")
  {
    core::PackageVersionResolver resolver(downloader, k_url, table);
    CHECK(resolver.resolve(CodeGenerator::nswag_csharp)
          == table.packages(CodeGenerator::nswag_csharp));
    CHECK(resolver.resolve(CodeGenerator::nswag_typescript)
          == table.packages(CodeGenerator::nswag_typescript));
    CHECK(downloader.request_count(k_url) == 2);
  }

  SUBCASE("No document URL")
  {
    core::PackageVersionResolver resolver(downloader, "", table);
    CHECK(resolver.resolve(CodeGenerator::nswag_typescript).size() == 2);
    CHECK(downloader.request_count("") == 0);
  }

  SUBCASE("HTTP error")
  {
    downloader.add_status(k_url, 500);
    core::PackageVersionResolver resolver(downloader, k_url, table);
    CHECK(resolver.resolve(CodeGenerator::nswag_csharp).size() == 3);
  }

  SUBCASE("Malformed document")
  {
    downloader.add(k_url, R"({"Version": "1.0", "Packages": )");
    core::PackageVersionResolver resolver(downloader, k_url, table);
    CHECK(resolver.resolve(CodeGenerator::nswag_csharp).size() == 3);
  }

  SUBCASE("Truncated document")
  {
    downloader.add(k_url, R"({"Packages": {"Some.Package": "2.0"}, "Vers)");
    core::PackageVersionResolver resolver(downloader, k_url, table);
    CHECK(resolver.resolve(CodeGenerator::nswag_csharp)
          == table.packages(CodeGenerator::nswag_csharp));
  }

  SUBCASE("Document without packages")
  {
    downloader.add(k_url, R"({"Version": "1.0"})");
    core::PackageVersionResolver resolver(downloader, k_url, table);
    CHECK(resolver.resolve(CodeGenerator::nswag_csharp).size() == 3);
  }
}

TEST_CASE("Remote document")
{
  const auto table = make_table();
  FakeDownloader downloader;

  SUBCASE("Used regardless of generator")
  {
    downloader.add(k_url,
                   R"({"Version": "1.0", "Packages": {"Some.Package": "2.0"}})");
    core::PackageVersionResolver resolver(downloader, k_url, table);
    const PackageMap expected{{"Some.Package", "2.0"}};
    CHECK(resolver.resolve(CodeGenerator::nswag_csharp) == expected);
    CHECK(resolver.resolve(CodeGenerator::nswag_typescript) == expected);
  }

  SUBCASE("Empty package list is used as is")
  {
    downloader.add(k_url, R"({"Version": "1.0", "Packages": {}})");
    core::PackageVersionResolver resolver(downloader, k_url, table);
    CHECK(resolver.resolve(CodeGenerator::nswag_csharp).empty());
  }
}

TEST_CASE("PackageVersionResolver::parse_version_document")
{
  SUBCASE("Ids are case-insensitive and the last one wins")
  {
    auto packages = core::PackageVersionResolver::parse_version_document(
      R"({"Packages": {"NSwag.ApiDescription.Client": "13.0.3",
                       "nswag.apidescription.client": "13.0.5"}})");
    REQUIRE(packages);
    REQUIRE(packages->size() == 1);
    CHECK(packages->begin()->first == "nswag.apidescription.client");
    CHECK(packages->begin()->second == "13.0.5");
    CHECK(packages->count("NSWAG.APIDESCRIPTION.CLIENT") == 1);
  }

  SUBCASE("Non-string version")
  {
    auto packages = core::PackageVersionResolver::parse_version_document(
      R"({"Packages": {"A": 1}})");
    REQUIRE(!packages);
    CHECK(packages.error() == "Expected string value for key 'A'");
  }

  SUBCASE("Incomplete or trailing content is rejected")
  {
    using core::PackageVersionResolver;
    CHECK(!PackageVersionResolver::parse_version_document(
      R"({"Version": "1.0", "Packages": {"A": "1.0"})"));
    CHECK(!PackageVersionResolver::parse_version_document(
      R"({"Version": "1.0", "Packages": {"A": "1.0"}} trailing junk)"));
    CHECK(!PackageVersionResolver::parse_version_document(
      R"({"Packages": {"A": "1.0"}, "Version": )"));
  }
}

TEST_CASE("core::parse_package_list")
{
  SUBCASE("Valid list")
  {
    auto packages = core::parse_package_list("A:1.0; b:2.0;a:1.1");
    REQUIRE(packages);
    REQUIRE(packages->size() == 2);
    CHECK(packages->at("A") == "1.1");
    CHECK(packages->at("B") == "2.0");
  }

  SUBCASE("Empty list")
  {
    auto packages = core::parse_package_list("");
    REQUIRE(packages);
    CHECK(packages->empty());
  }

  SUBCASE("Missing version")
  {
    auto packages = core::parse_package_list("A:1.0;B");
    REQUIRE(!packages);
    CHECK(packages.error()
          == "invalid package entry \"B\", expected id:version");
  }
}

TEST_CASE("PackageTable::builtin")
{
  const auto table = core::PackageTable::builtin();
  CHECK(!table.packages(CodeGenerator::nswag_csharp).empty());
  CHECK(!table.packages(CodeGenerator::nswag_typescript).empty());
}

TEST_SUITE_END();
