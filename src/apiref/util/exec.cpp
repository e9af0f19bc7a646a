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

#include "exec.hpp"

#include <apiref/util/fd.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>
#include <apiref/util/string.hpp>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <optional>

extern char** environ;

namespace fs = util::filesystem;

// Call a libc-style function (returns 0 on success and sets errno) and return
// tl::unexpected on error.
#define CHECK_LIB_CALL(function, ...)                                          \
  {                                                                            \
    int _result = function(__VA_ARGS__);                                       \
    if (_result != 0) {                                                        \
      return tl::unexpected(FMT(#function " failed: {}", strerror(_result)));  \
    }                                                                          \
  }                                                                            \
  static_assert(true) /* allow semicolon after macro */

namespace {

class SpawnFileActions
{
public:
  SpawnFileActions()
  {
    posix_spawn_file_actions_init(&m_actions);
  }

  ~SpawnFileActions()
  {
    posix_spawn_file_actions_destroy(&m_actions);
  }

  SpawnFileActions(const SpawnFileActions&) = delete;
  SpawnFileActions& operator=(const SpawnFileActions&) = delete;

  posix_spawn_file_actions_t*
  get()
  {
    return &m_actions;
  }

private:
  posix_spawn_file_actions_t m_actions;
};

tl::expected<void, std::string>
make_pipe(util::Fd& read_end, util::Fd& write_end)
{
  int pipefd[2];
  if (pipe(pipefd) != 0) {
    return tl::unexpected(FMT("pipe failed: {}", strerror(errno)));
  }
  read_end = util::Fd(pipefd[0]);
  write_end = util::Fd(pipefd[1]);
  return {};
}

const std::chrono::milliseconds k_reap_poll_interval{50};

int
decode_wait_status(int status)
{
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

tl::expected<int, std::string>
wait_for_exit(pid_t pid)
{
  int status;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return tl::unexpected(FMT("waitpid failed: {}", strerror(errno)));
    }
  }
  return decode_wait_status(status);
}

// Return the exit status if `pid` has exited, otherwise nullopt.
tl::expected<std::optional<int>, std::string>
try_reap(pid_t pid)
{
  int status;
  pid_t result;
  do {
    result = waitpid(pid, &status, WNOHANG);
  } while (result == -1 && errno == EINTR);
  if (result == -1) {
    return tl::unexpected(FMT("waitpid failed: {}", strerror(errno)));
  }
  if (result == 0) {
    return std::nullopt;
  }
  return decode_wait_status(status);
}

} // namespace

namespace util {

tl::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& args,
            const std::filesystem::path& working_dir,
            std::chrono::milliseconds timeout)
{
  if (args.empty()) {
    return tl::unexpected("empty command");
  }

  std::vector<const char*> argv;
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);
  LOG("Executing command in {}: {}",
      working_dir,
      format_argv_for_logging(argv.data()));

  Fd stdout_read;
  Fd stdout_write;
  Fd stderr_read;
  Fd stderr_write;
  if (auto r = make_pipe(stdout_read, stdout_write); !r) {
    return tl::unexpected(r.error());
  }
  if (auto r = make_pipe(stderr_read, stderr_write); !r) {
    return tl::unexpected(r.error());
  }

  SpawnFileActions fa;
  CHECK_LIB_CALL(posix_spawn_file_actions_addclose, fa.get(), *stdout_read);
  CHECK_LIB_CALL(posix_spawn_file_actions_addclose, fa.get(), *stderr_read);
  CHECK_LIB_CALL(
    posix_spawn_file_actions_addopen, fa.get(), 0, "/dev/null", O_RDONLY, 0);
  CHECK_LIB_CALL(posix_spawn_file_actions_adddup2, fa.get(), *stdout_write, 1);
  CHECK_LIB_CALL(posix_spawn_file_actions_adddup2, fa.get(), *stderr_write, 2);
  CHECK_LIB_CALL(posix_spawn_file_actions_addclose, fa.get(), *stdout_write);
  CHECK_LIB_CALL(posix_spawn_file_actions_addclose, fa.get(), *stderr_write);
  if (!working_dir.empty()) {
    CHECK_LIB_CALL(
      posix_spawn_file_actions_addchdir_np, fa.get(), working_dir.c_str());
  }

  pid_t pid;
  auto argv_mutable = const_cast<char* const*>(argv.data());
  int spawn_result =
    posix_spawnp(&pid, argv[0], fa.get(), nullptr, argv_mutable, environ);
  stdout_write.close();
  stderr_write.close();
  if (spawn_result != 0) {
    return tl::unexpected(
      FMT("posix_spawnp failed: {}", strerror(spawn_result)));
  }

  ProcessResult result;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::optional<int> exit_status;

  std::string* sinks[] = {&result.stdout_data, &result.stderr_data};
  Fd* sources[] = {&stdout_read, &stderr_read};

  // Completion is decided by reaping the process. Its pipes may be closed
  // early or be held open by a background child.
  while (true) {
    if (!exit_status) {
      auto reaped = try_reap(pid);
      if (!reaped) {
        kill(pid, SIGKILL);
        (void)wait_for_exit(pid);
        return tl::unexpected(reaped.error());
      }
      exit_status = *reaped;
    }
    if (exit_status && !stdout_read && !stderr_read) {
      break;
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      if (!exit_status) {
        LOG("Killing process {} after {} ms", pid, timeout.count());
        kill(pid, SIGKILL);
        result.timed_out = true;
      }
      break;
    }

    pollfd fds[2];
    nfds_t nfds = 0;
    size_t index[2];
    for (size_t i = 0; i < 2; ++i) {
      if (*sources[i]) {
        fds[nfds] = {sources[i]->get(), POLLIN, 0};
        index[nfds] = i;
        ++nfds;
      }
    }

    // Once the process has exited, only drain what is already buffered.
    const int poll_timeout =
      exit_status ? 0
                  : static_cast<int>(
                    std::min(remaining, k_reap_poll_interval).count());
    int ready = poll(fds, nfds, poll_timeout);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int poll_errno = errno;
      if (!exit_status) {
        kill(pid, SIGKILL);
        (void)wait_for_exit(pid);
      }
      return tl::unexpected(FMT("poll failed: {}", strerror(poll_errno)));
    }
    if (ready == 0 && exit_status) {
      break;
    }

    for (nfds_t i = 0; i < nfds; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      char buffer[4096];
      const auto n = read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        sinks[index[i]]->append(buffer, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        sources[index[i]]->close();
      }
    }
  }

  if (!exit_status) {
    auto status = wait_for_exit(pid);
    if (!status) {
      return tl::unexpected(status.error());
    }
    exit_status = *status;
  }
  result.exit_status = *exit_status;
  LOG("Process {} exited with status {}", pid, result.exit_status);
  return result;
}

std::optional<std::filesystem::path>
find_executable_in_path(const std::string& name,
                        const std::vector<std::filesystem::path>& path_list)
{
  for (const auto& dir : path_list) {
    const auto candidate = dir / name;
    // Must exist (e.g., should not be a broken symlink) and be an executable.
    if (access(candidate.c_str(), X_OK) == 0
        && !fs::is_directory(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace util
