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

#include <apiref/core/packagetable.hpp>

#include <tl/expected.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace core {

struct InstallFailure
{
  std::string message;
  std::string stdout_data;
  std::string stderr_data;
};

// Adds packages to a project.
class DependencyInstaller
{
public:
  virtual ~DependencyInstaller() = default;

  // Install all `packages`, stopping at the first failure.
  virtual tl::expected<void, InstallFailure>
  install(const PackageMap& packages) = 0;
};

// Installs packages by running "<command> add package <id> --version <version>
// --no-restore" in the project directory, once per package.
class ProcessDependencyInstaller : public DependencyInstaller
{
public:
  ProcessDependencyInstaller(std::string command,
                             std::filesystem::path project_dir,
                             std::chrono::seconds timeout);

  tl::expected<void, InstallFailure>
  install(const PackageMap& packages) override;

private:
  std::string m_command;
  std::filesystem::path m_project_dir;
  std::chrono::seconds m_timeout;
};

} // namespace core
