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

#include "registration.hpp"

#include <apiref/core/dependencyinstaller.hpp>
#include <apiref/core/exceptions.hpp>
#include <apiref/core/packageresolver.hpp>
#include <apiref/net/url.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>
#include <apiref/util/path.hpp>
#include <apiref/util/string.hpp>

namespace fs = util::filesystem;

namespace core {

std::string_view
to_string(RegistrationState state)
{
  switch (state) {
  case RegistrationState::resolve_inputs:
    return "ResolveInputs";
  case RegistrationState::ensure_dependencies:
    return "EnsureDependencies";
  case RegistrationState::acquire_content:
    return "AcquireContent";
  case RegistrationState::register_reference:
    return "RegisterReference";
  case RegistrationState::done:
    return "Done";
  case RegistrationState::rejected:
    return "Rejected";
  }
  return {};
}

ReferenceRegistrationWorkflow::ReferenceRegistrationWorkflow(
  PackageVersionResolver& resolver,
  DependencyInstaller& installer,
  ContentFetcher& fetcher,
  ReferenceStore& store,
  Options options)
  : m_resolver(resolver),
    m_installer(installer),
    m_fetcher(fetcher),
    m_store(store),
    m_options(std::move(options))
{
}

void
ReferenceRegistrationWorkflow::transition(RegistrationState state)
{
  LOG("Registration: {} -> {}", to_string(m_state), to_string(state));
  m_state = state;
}

std::optional<std::string>
ReferenceRegistrationWorkflow::validate(
  const RegistrationRequest& request) const
{
  if (request.code_generator
      && !parse_code_generator(*request.code_generator)) {
    return FMT("Invalid value '{}' given as code generator.",
               *request.code_generator);
  }

  switch (request.kind) {
  case SourceKind::url:
    if (request.source.empty() || !net::is_remote_url(request.source)) {
      return FMT("{} was not valid. Valid values are URLs", request.source);
    }
    if (request.output_file && request.output_file->empty()) {
      return std::string("The output file must not be empty.");
    }
    break;

  case SourceKind::file: {
    if (request.source.empty() || net::is_remote_url(request.source)) {
      return FMT("{} was not valid. Valid values are local files",
                 request.source);
    }
    const auto path = util::make_absolute(request.source, m_options.base_dir);
    if (!fs::is_regular_file(path)) {
      return FMT("The file '{}' does not exist.", path);
    }
    break;
  }

  case SourceKind::project: {
    const auto path = util::make_absolute(request.source, m_options.base_dir);
    if (request.source.empty() || !fs::is_regular_file(path)
        || !util::ends_with(request.source, m_options.project_extension)) {
      return FMT("The project '{}' does not exist.", path);
    }
    break;
  }
  }

  return std::nullopt;
}

RegistrationResult
ReferenceRegistrationWorkflow::run(const RegistrationRequest& request)
{
  RegistrationResult result;
  m_state = RegistrationState::resolve_inputs;

  if (auto message = validate(request)) {
    transition(RegistrationState::rejected);
    result.state = m_state;
    result.exit_status = 1;
    result.message = std::move(*message);
    return result;
  }
  const auto generator =
    request.code_generator ? *parse_code_generator(*request.code_generator)
                           : m_options.default_generator;

  transition(RegistrationState::ensure_dependencies);
  const auto packages = m_resolver.resolve(generator);
  const auto installed = m_installer.install(packages);
  if (!installed) {
    throw InstallError(installed.error().message,
                       installed.error().stdout_data,
                       installed.error().stderr_data);
  }

  std::string local_path = request.source;
  std::optional<std::string> identity;
  const ReferenceKind* kind = &k_url_reference;

  switch (request.kind) {
  case SourceKind::url: {
    transition(RegistrationState::acquire_content);
    local_path = request.output_file.value_or(m_options.default_output_file);
    identity = request.source;
    const auto destination =
      util::make_absolute(local_path, m_options.base_dir);
    PRINT(m_options.output, "Downloading to '{}'.\n", destination);
    result.download =
      m_fetcher.fetch(request.source, destination, Overwrite::no);
    if (result.download->result == DownloadOutcome::Result::unchanged) {
      PRINT(m_options.output,
            "Not overwriting existing and matching file '{}'.\n",
            result.download->path);
    }
    break;
  }

  case SourceKind::file:
    break;

  case SourceKind::project:
    kind = &k_project_reference;
    identity =
      util::make_absolute(request.source, m_options.base_dir).string();
    break;
  }

  transition(RegistrationState::register_reference);
  result.registration = m_store.register_reference(
    *kind,
    local_path,
    identity,
    {{"CodeGenerator", std::string(to_string(generator))}});

  switch (*result.registration) {
  case RegisterResult::added:
    break;
  case RegisterResult::duplicate_path:
    PRINT(m_options.warnings,
          "apiref: warning: One or more references to {} already exist."
          " Duplicate references could lead to unexpected behavior.\n",
          local_path);
    break;
  case RegisterResult::duplicate_identity:
    PRINT(m_options.warnings,
          "apiref: warning: A reference to '{}' already exists in '{}'.\n",
          *identity,
          m_store.project_path());
    break;
  }

  transition(RegistrationState::done);
  result.state = m_state;
  result.exit_status = 0;
  return result;
}

} // namespace core
