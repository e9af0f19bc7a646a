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

#include "logging.hpp"

#include <apiref/util/file.hpp>
#include <apiref/util/filestream.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/time.hpp>

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

// Logfile path and file handle, read from Config::log_file().
fs::path logfile_path;
util::FileStream logfile;

// Mutex that serializes writes to logfile.
std::mutex log_mutex;

// Print error message to stderr about failure writing to the log file and exit
// with failure.
[[noreturn]] void
print_fatal_error_and_exit()
{
  // Note: Can't throw Fatal since that would lead to recursion.
  try {
    PRINT(stderr,
          "apiref: error: Failed to write to {}: {}\n",
          logfile_path,
          strerror(errno));
  } catch (std::runtime_error&) { // NOLINT: this is deliberate
    // Ignore since we can't do anything about it.
  }
  exit(EXIT_FAILURE);
}

void
format_prefix(char* buffer, size_t size)
{
  const auto now = util::now();
  (void)snprintf(buffer,
                 size,
                 "[%s.%06u %-5d] ",
                 util::format_iso8601_timestamp(now).c_str(),
                 static_cast<unsigned int>(util::nsec_part(now) / 1000),
                 static_cast<int>(getpid()));
}

} // namespace

namespace util::logging {

void
init(const fs::path& log_file)
{
  logfile.close();
  logfile_path = log_file;

  if (log_file.empty()) {
    return;
  }
  if (log_file == "-") {
    logfile = util::FileStream(stderr);
    return;
  }

  logfile.open(logfile_path, "a");
  if (logfile) {
    util::set_cloexec_flag(fileno(*logfile));
  } else {
    print_fatal_error_and_exit();
  }
}

bool
enabled()
{
  return logfile;
}

void
log(std::string_view message)
{
  if (!enabled()) {
    return;
  }

  char prefix[200];
  format_prefix(prefix, sizeof(prefix));

  std::unique_lock<std::mutex> lock(log_mutex);
  if (fputs(prefix, *logfile) == EOF
      || (!message.empty()
          && fwrite(message.data(), message.length(), 1, *logfile) != 1)
      || fputc('\n', *logfile) == EOF || fflush(*logfile) == EOF) {
    print_fatal_error_and_exit();
  }
}

} // namespace util::logging
