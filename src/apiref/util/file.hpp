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

#include <nonstd/span.hpp>
#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace util {

// --- Interface ---

enum class WriteFileMode {
  unlink,    // unlink existing file before writing (break hard links)
  in_place,  // don't unlink before writing (don't break hard links)
  exclusive, // return error if the file already exists (O_EXCL)
};
enum class LogFailure { yes, no };

using DataReceiver = std::function<void(nonstd::span<const uint8_t> data)>;

// Read data from `fd` until end of file and call `data_receiver` repeatedly
// with the read data. Returns an error if the underlying read(2) call returned
// -1.
tl::expected<void, std::string> read_fd(int fd, DataReceiver data_receiver);

// Return contents of file at `path`. Binary safe.
tl::expected<std::string, std::string>
read_file(const std::filesystem::path& path);

// Remove `path` (non-directory).
//
// Returns whether the file was removed. A nonexistent `path` is considered
// successful.
tl::expected<bool, std::error_code>
remove(const std::filesystem::path& path,
       LogFailure log_failure = LogFailure::yes);

// Set the FD_CLOEXEC on file descriptor `fd`.
void set_cloexec_flag(int fd);

// Write `size` bytes from binary `data` to `fd`.
tl::expected<void, std::string> write_fd(int fd, const void* data, size_t size);

// Write `data` to `path`.
tl::expected<void, std::string>
write_file(const std::filesystem::path& path,
           std::string_view data,
           WriteFileMode mode = WriteFileMode::unlink);

} // namespace util
