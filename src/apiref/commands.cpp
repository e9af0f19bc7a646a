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

#include "commands.hpp"

#include <apiref/config.hpp>
#include <apiref/core/contentfetcher.hpp>
#include <apiref/core/dependencyinstaller.hpp>
#include <apiref/core/exceptions.hpp>
#include <apiref/core/packageresolver.hpp>
#include <apiref/core/packagetable.hpp>
#include <apiref/core/projectfile.hpp>
#include <apiref/core/referencestore.hpp>
#include <apiref/net/httpdownloader.hpp>
#include <apiref/net/url.hpp>
#include <apiref/util/expected.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>
#include <apiref/util/path.hpp>

#include <cstdlib>

namespace fs = util::filesystem;

namespace {

const char k_default_output_file[] = "openapi/openapi.json";

fs::path
working_directory()
{
  return util::value_or_throw<core::Fatal>(
    fs::current_path(), "failed to get current working directory: ");
}

} // namespace

int
add_reference(const Config& config,
              core::SourceKind kind,
              const std::string& source,
              const CommandOptions& options)
{
  const auto working_dir = working_directory();
  const auto project_path = core::resolve_project_file(
    options.project, working_dir, config.project_extension());
  LOG("Using project {}", project_path);

  auto project = core::ProjectFile::load(project_path);
  net::HttpDownloader downloader(config.connect_timeout(),
                                 config.operation_timeout());
  const auto package_table = core::PackageTable::builtin();
  core::PackageVersionResolver resolver(
    downloader, config.package_version_url(), package_table);
  core::ProcessDependencyInstaller installer(config.install_command(),
                                             project_path.parent_path(),
                                             config.install_timeout());
  core::ContentFetcher fetcher(downloader, working_dir);
  core::ReferenceStore store(project, working_dir);

  core::ReferenceRegistrationWorkflow::Options workflow_options;
  workflow_options.base_dir = working_dir;
  workflow_options.default_generator = config.code_generator();
  workflow_options.default_output_file = k_default_output_file;
  workflow_options.project_extension = config.project_extension();
  core::ReferenceRegistrationWorkflow workflow(
    resolver, installer, fetcher, store, workflow_options);

  core::RegistrationRequest request;
  request.kind = kind;
  request.source = source;
  request.output_file = options.output_file;
  request.code_generator = options.code_generator;

  const auto result = workflow.run(request);
  if (result.state == core::RegistrationState::rejected) {
    PRINT(stderr, "apiref: error: {}\n", result.message);
  }
  return result.exit_status;
}

int
remove_reference(const Config& config,
                 const std::string& source,
                 const CommandOptions& options)
{
  const auto working_dir = working_directory();
  const auto project_path = core::resolve_project_file(
    options.project, working_dir, config.project_extension());

  auto project = core::ProjectFile::load(project_path);
  core::ReferenceStore store(project, working_dir);

  const auto removed_documents =
    store.remove_references(core::k_url_reference, source);
  const auto removed_projects =
    store.remove_references(core::k_project_reference, source);

  for (const auto& item : removed_documents) {
    // Only URL references own their local file.
    if (item.metadata_value(core::k_url_reference.identity_metadata)) {
      const auto path = util::make_absolute(item.include, working_dir);
      const auto result = util::remove(path);
      if (!result) {
        PRINT(stderr,
              "apiref: warning: Failed to remove {}: {}\n",
              path,
              result.error().message());
      }
    }
    PRINT(stdout, "Removed reference to '{}'.\n", item.include);
  }
  for (const auto& item : removed_projects) {
    PRINT(stdout, "Removed reference to '{}'.\n", item.include);
  }

  if (removed_documents.empty() && removed_projects.empty()) {
    PRINT(stderr,
          "apiref: warning: No reference to '{}' was found in '{}'.\n",
          source,
          project_path);
  }
  return EXIT_SUCCESS;
}

int
refresh_reference(const Config& config,
                  const std::string& source_url,
                  const CommandOptions& options)
{
  if (!net::is_remote_url(source_url)) {
    throw core::ValidationError(
      FMT("{} was not valid. Valid values are URLs", source_url));
  }

  const auto working_dir = working_directory();
  const auto project_path = core::resolve_project_file(
    options.project, working_dir, config.project_extension());

  auto project = core::ProjectFile::load(project_path);
  core::ReferenceStore store(project, working_dir);
  const auto item = store.find_by_identity(core::k_url_reference, source_url);
  if (!item) {
    throw core::ValidationError(
      FMT("No reference to '{}' was found in '{}'.", source_url, project_path));
  }

  net::HttpDownloader downloader(config.connect_timeout(),
                                 config.operation_timeout());
  core::ContentFetcher fetcher(downloader, working_dir);
  const auto destination = util::make_absolute(item->include, working_dir);
  PRINT(stdout, "Downloading to '{}'.\n", destination);
  fetcher.fetch(source_url, destination, core::Overwrite::yes);
  return EXIT_SUCCESS;
}
