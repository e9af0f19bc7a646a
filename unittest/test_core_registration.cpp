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
#include <apiref/core/projectfile.hpp>
#include <apiref/core/referencestore.hpp>
#include <apiref/core/registration.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>

#include <doctest/doctest.h>

#include <cstdio>
#include <memory>

using core::RegistrationRequest;
using core::RegistrationState;
using core::SourceKind;
using TestUtil::FakeDownloader;
using TestUtil::FakeInstaller;
using TestUtil::TestContext;

namespace fs = util::filesystem;

namespace {

const std::string k_url = "https://example.com/openapi.json";
const std::string k_content = R"({"openapi": "3.0.0"})";
const std::string k_project_text = "# Test project\n";

struct Fixture
{
  std::filesystem::path cwd;
  FakeDownloader downloader;
  FakeInstaller installer;
  core::PackageTable table{{{"NSwag.ApiDescription.Client", "13.0.5"},
                            {"Newtonsoft.Json", "12.0.2"}},
                           {{"NSwag.ApiDescription.Client", "13.0.5"}}};
  core::PackageVersionResolver resolver{downloader, "", table};
  std::unique_ptr<FILE, decltype(&fclose)> output{tmpfile(), &fclose};
  std::unique_ptr<FILE, decltype(&fclose)> warnings{tmpfile(), &fclose};

  Fixture()
  {
    cwd = *fs::current_path();
    REQUIRE(util::write_file("app.apiproj", k_project_text));
  }

  core::RegistrationResult
  run(const RegistrationRequest& request)
  {
    auto project = core::ProjectFile::load("app.apiproj");
    core::ReferenceStore store(project, cwd);
    core::ContentFetcher fetcher(downloader, cwd);
    core::ReferenceRegistrationWorkflow::Options options;
    options.base_dir = cwd;
    options.output = output.get();
    options.warnings = warnings.get();
    core::ReferenceRegistrationWorkflow workflow(
      resolver, installer, fetcher, store, options);
    auto result = workflow.run(request);
    CHECK(workflow.state() == result.state);
    return result;
  }

  std::vector<core::ProjectItem>
  items(std::string_view tag) const
  {
    return core::ProjectFile::load("app.apiproj").get_items(tag);
  }
};

RegistrationRequest
url_request(const std::string& url)
{
  RegistrationRequest request;
  request.kind = SourceKind::url;
  request.source = url;
  return request;
}

} // namespace

TEST_SUITE_BEGIN("core::ReferenceRegistrationWorkflow");

TEST_CASE("Invalid URL is rejected before anything is changed")
{
  TestContext test_context;
  Fixture f;

  const auto result = f.run(url_request("not-a-url"));
  CHECK(result.state == RegistrationState::rejected);
  CHECK(result.exit_status == 1);
  CHECK(result.message == "not-a-url was not valid. Valid values are URLs");
  CHECK(f.installer.calls.empty());
  CHECK(*util::read_file("app.apiproj") == k_project_text);
  CHECK(!fs::exists("openapi"));
}

TEST_CASE("Invalid code generator")
{
  TestContext test_context;
  Fixture f;

  auto request = url_request(k_url);
  request.code_generator = "NSwagJava";
  const auto result = f.run(request);
  CHECK(result.state == RegistrationState::rejected);
  CHECK(result.message == "Invalid value 'NSwagJava' given as code generator.");
  CHECK(f.installer.calls.empty());
}

TEST_CASE("Empty output file")
{
  TestContext test_context;
  Fixture f;

  auto request = url_request(k_url);
  request.output_file = "";
  const auto result = f.run(request);
  CHECK(result.state == RegistrationState::rejected);
  CHECK(result.message == "The output file must not be empty.");
}

TEST_CASE("Add URL reference")
{
  TestContext test_context;
  Fixture f;
  f.downloader.add(k_url, k_content);

  const auto result = f.run(url_request(k_url));
  CHECK(result.state == RegistrationState::done);
  CHECK(result.exit_status == 0);
  REQUIRE(result.download);
  CHECK(result.download->result == core::DownloadOutcome::Result::written);
  CHECK(result.registration == core::RegisterResult::added);

  REQUIRE(f.installer.calls.size() == 1);
  CHECK(f.installer.calls[0] == f.table.packages(core::CodeGenerator::nswag_csharp));

  CHECK(*util::read_file("openapi/openapi.json") == k_content);
  CHECK(TestUtil::read_stream(f.output.get())
        == FMT("Downloading to '{}'.\n", f.cwd / "openapi" / "openapi.json"));

  const auto items = f.items("OpenApiReference");
  REQUIRE(items.size() == 1);
  CHECK(items[0].include == "openapi/openapi.json");
  CHECK(items[0].metadata_value("SourceUrl") == k_url);
  CHECK(items[0].metadata_value("CodeGenerator") == "NSwagCSharp");

  SUBCASE("Running again warns about the duplicate")
  {
    const auto again = f.run(url_request(k_url));
    CHECK(again.state == RegistrationState::done);
    CHECK(again.exit_status == 0);
    REQUIRE(again.download);
    CHECK(again.download->result == core::DownloadOutcome::Result::unchanged);
    CHECK(again.registration == core::RegisterResult::duplicate_path);
    CHECK(TestUtil::read_stream(f.warnings.get())
          == "apiref: warning: One or more references to openapi/openapi.json"
             " already exist. Duplicate references could lead to unexpected"
             " behavior.\n");
    CHECK(f.items("OpenApiReference").size() == 1);
  }

  SUBCASE("Same URL to another output file")
  {
    auto request = url_request(k_url);
    request.output_file = "other.json";
    const auto again = f.run(request);
    CHECK(again.registration == core::RegisterResult::duplicate_identity);
    CHECK(TestUtil::read_stream(f.warnings.get())
          == FMT("apiref: warning: A reference to '{}' already exists in"
                 " '{}'.\n",
                 k_url,
                 "app.apiproj"));
    CHECK(f.items("OpenApiReference").size() == 1);
  }
}

TEST_CASE("TypeScript generator")
{
  TestContext test_context;
  Fixture f;
  f.downloader.add(k_url, k_content);

  auto request = url_request(k_url);
  request.code_generator = "NSwagTypeScript";
  request.output_file = "api/petstore.json";
  const auto result = f.run(request);
  CHECK(result.state == RegistrationState::done);
  REQUIRE(f.installer.calls.size() == 1);
  CHECK(f.installer.calls[0].size() == 1);
  CHECK(fs::is_regular_file("api/petstore.json"));

  const auto items = f.items("OpenApiReference");
  REQUIRE(items.size() == 1);
  CHECK(items[0].include == "api/petstore.json");
  CHECK(items[0].metadata_value("CodeGenerator") == "NSwagTypeScript");
}

TEST_CASE("Packages added during installation are kept")
{
  TestContext test_context;
  Fixture f;
  f.installer.project_file = "app.apiproj";

  REQUIRE(util::write_file("local.json", k_content));
  RegistrationRequest request;
  request.kind = SourceKind::file;
  request.source = "local.json";
  const auto result = f.run(request);
  CHECK(result.state == RegistrationState::done);

  CHECK(*util::read_file("app.apiproj")
        == "# Test project\n"
           "PackageReference = Newtonsoft.Json\n"
           "  Version = 12.0.2\n"
           "PackageReference = NSwag.ApiDescription.Client\n"
           "  Version = 13.0.5\n"
           "OpenApiReference = local.json\n"
           "  CodeGenerator = NSwagCSharp\n");
}

TEST_CASE("Failed installation leaves the project untouched")
{
  TestContext test_context;
  Fixture f;
  f.downloader.add(k_url, k_content);
  f.installer.failure =
    core::InstallFailure{"Could not add package `Newtonsoft.Json`", "out", "err"};

  try {
    f.run(url_request(k_url));
    FAIL("expected InstallError");
  } catch (const core::InstallError& e) {
    CHECK(std::string(e.what()) == "Could not add package `Newtonsoft.Json`");
    CHECK(e.stdout_data() == "out");
    CHECK(e.stderr_data() == "err");
  }
  CHECK(*util::read_file("app.apiproj") == k_project_text);
  CHECK(!fs::exists("openapi"));
  CHECK(f.downloader.request_count(k_url) == 0);
}

TEST_CASE("Failed download leaves the project untouched")
{
  TestContext test_context;
  Fixture f;
  f.downloader.add_status(k_url, 404);

  CHECK_THROWS_AS(f.run(url_request(k_url)), core::DownloadError);
  CHECK(*util::read_file("app.apiproj") == k_project_text);
  CHECK(!fs::exists("openapi/openapi.json"));
}

TEST_CASE("Add file reference")
{
  TestContext test_context;
  Fixture f;

  SUBCASE("Existing file")
  {
    REQUIRE(util::write_file("local.json", k_content));
    RegistrationRequest request;
    request.kind = SourceKind::file;
    request.source = "local.json";
    const auto result = f.run(request);
    CHECK(result.state == RegistrationState::done);
    CHECK(!result.download);
    CHECK(f.installer.calls.size() == 1);

    const auto items = f.items("OpenApiReference");
    REQUIRE(items.size() == 1);
    CHECK(items[0].include == "local.json");
    CHECK(!items[0].metadata_value("SourceUrl"));
    CHECK(items[0].metadata_value("CodeGenerator") == "NSwagCSharp");
  }

  SUBCASE("Missing file")
  {
    RegistrationRequest request;
    request.kind = SourceKind::file;
    request.source = "missing.json";
    const auto result = f.run(request);
    CHECK(result.state == RegistrationState::rejected);
    CHECK(result.message
          == FMT("The file '{}' does not exist.", f.cwd / "missing.json"));
  }

  SUBCASE("URL given as file")
  {
    RegistrationRequest request;
    request.kind = SourceKind::file;
    request.source = k_url;
    const auto result = f.run(request);
    CHECK(result.state == RegistrationState::rejected);
    CHECK(result.message
          == FMT("{} was not valid. Valid values are local files", k_url));
  }
}

TEST_CASE("Add project reference")
{
  TestContext test_context;
  Fixture f;

  SUBCASE("Existing project")
  {
    REQUIRE(fs::create_directories("server"));
    REQUIRE(util::write_file("server/server.apiproj", ""));
    RegistrationRequest request;
    request.kind = SourceKind::project;
    request.source = "server/server.apiproj";
    const auto result = f.run(request);
    CHECK(result.state == RegistrationState::done);

    const auto items = f.items("OpenApiProjectReference");
    REQUIRE(items.size() == 1);
    CHECK(items[0].include == "server/server.apiproj");
    CHECK(items[0].metadata_value("SourceProject")
          == (f.cwd / "server" / "server.apiproj").string());
  }

  SUBCASE("Wrong extension")
  {
    REQUIRE(util::write_file("server.txt", ""));
    RegistrationRequest request;
    request.kind = SourceKind::project;
    request.source = "server.txt";
    const auto result = f.run(request);
    CHECK(result.state == RegistrationState::rejected);
    CHECK(result.message
          == FMT("The project '{}' does not exist.", f.cwd / "server.txt"));
  }
}

TEST_CASE("to_string(RegistrationState)")
{
  CHECK(core::to_string(RegistrationState::resolve_inputs) == "ResolveInputs");
  CHECK(core::to_string(RegistrationState::rejected) == "Rejected");
}

TEST_SUITE_END();
