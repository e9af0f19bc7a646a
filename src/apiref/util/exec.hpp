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

#include <tl/expected.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace util {

struct ProcessResult
{
  int exit_status = -1;
  std::string stdout_data;
  std::string stderr_data;
  bool timed_out = false;
};

// Execute `args` in `working_dir` and capture its standard output and standard
// error. If the process has not exited after `timeout` it is killed with
// SIGKILL and `timed_out` is set. Returns an error only if the process could
// not be started or waited for.
tl::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& args,
            const std::filesystem::path& working_dir,
            std::chrono::milliseconds timeout);

// Return the first executable file named `name` in `path_list`, or nullopt if
// no such file exists.
std::optional<std::filesystem::path>
find_executable_in_path(const std::string& name,
                        const std::vector<std::filesystem::path>& path_list);

} // namespace util
