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

#include "dependencyinstaller.hpp"

#include <apiref/util/environment.hpp>
#include <apiref/util/exec.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>

namespace core {

ProcessDependencyInstaller::ProcessDependencyInstaller(
  std::string command,
  std::filesystem::path project_dir,
  std::chrono::seconds timeout)
  : m_command(std::move(command)),
    m_project_dir(std::move(project_dir)),
    m_timeout(timeout)
{
}

tl::expected<void, InstallFailure>
ProcessDependencyInstaller::install(const PackageMap& packages)
{
  std::string executable = m_command;
  if (m_command.find('/') == std::string::npos) {
    const auto found =
      util::find_executable_in_path(m_command, util::getenv_path_list("PATH"));
    if (!found) {
      return tl::unexpected(
        InstallFailure{FMT("{} was not found on the path.", m_command), {}, {}});
    }
    executable = found->string();
  }

  for (const auto& [id, version] : packages) {
    const auto result = util::run_process(
      {executable, "add", "package", id, "--version", version, "--no-restore"},
      m_project_dir,
      m_timeout);
    if (!result) {
      return tl::unexpected(InstallFailure{
        FMT("Could not add package `{}` to `{}`: {}",
            id,
            m_project_dir,
            result.error()),
        {},
        {}});
    }
    if (result->timed_out) {
      return tl::unexpected(InstallFailure{
        FMT("Adding package `{}` to `{}` took longer than {} seconds.",
            id,
            m_project_dir,
            m_timeout.count()),
        result->stdout_data,
        result->stderr_data});
    }
    if (result->exit_status != 0) {
      return tl::unexpected(InstallFailure{
        FMT("Could not add package `{}` to `{}`", id, m_project_dir),
        result->stdout_data,
        result->stderr_data});
    }
    LOG("Added package {} {} to {}", id, version, m_project_dir);
  }
  return {};
}

} // namespace core
