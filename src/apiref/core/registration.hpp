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

#pragma once

#include <apiref/core/codegenerator.hpp>
#include <apiref/core/contentfetcher.hpp>
#include <apiref/core/referencestore.hpp>

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace core {

class DependencyInstaller;
class PackageVersionResolver;

enum class SourceKind { url, file, project };

struct RegistrationRequest
{
  SourceKind kind = SourceKind::url;
  std::string source; // URL, OpenAPI file path or project path
  std::optional<std::string> output_file;
  std::optional<std::string> code_generator;
};

enum class RegistrationState {
  resolve_inputs,
  ensure_dependencies,
  acquire_content,
  register_reference,
  done,
  rejected,
};

std::string_view to_string(RegistrationState state);

struct RegistrationResult
{
  RegistrationState state = RegistrationState::resolve_inputs;
  int exit_status = 1;
  std::string message; // validation message if rejected
  std::optional<DownloadOutcome> download;
  std::optional<RegisterResult> registration;
};

// Registers an OpenAPI reference in a project: validate the request, add the
// code generator's packages to the project, download remote content and
// record the reference. Installation and download failures are thrown
// (core::InstallError, core::DownloadError) before the project file has been
// modified.
class ReferenceRegistrationWorkflow
{
public:
  struct Options
  {
    std::filesystem::path base_dir; // relative paths are resolved against this
    CodeGenerator default_generator = CodeGenerator::nswag_csharp;
    std::string default_output_file = "openapi/openapi.json";
    std::string project_extension = ".apiproj";
    FILE* output = stdout;
    FILE* warnings = stderr;
  };

  ReferenceRegistrationWorkflow(PackageVersionResolver& resolver,
                                DependencyInstaller& installer,
                                ContentFetcher& fetcher,
                                ReferenceStore& store,
                                Options options);

  RegistrationResult run(const RegistrationRequest& request);

  RegistrationState state() const;

private:
  PackageVersionResolver& m_resolver;
  DependencyInstaller& m_installer;
  ContentFetcher& m_fetcher;
  ReferenceStore& m_store;
  Options m_options;
  RegistrationState m_state = RegistrationState::resolve_inputs;

  void transition(RegistrationState state);

  // Return a validation message if `request` cannot be carried out.
  std::optional<std::string> validate(const RegistrationRequest& request) const;
};

inline RegistrationState
ReferenceRegistrationWorkflow::state() const
{
  return m_state;
}

} // namespace core
