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

#include "hash.hpp"

#include <apiref/util/fd.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>

#include <fcntl.h>

#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

Hash::Hash()
{
  blake3_hasher_init(&m_hasher);
}

Hash::Digest
Hash::digest() const
{
  // Note that blake3_hasher_finalize doesn't modify the hasher itself, thus it
  // is possible to finalize again after more data has been added.
  Digest digest;
  blake3_hasher_finalize(&m_hasher, digest.data(), digest.size());
  return digest;
}

Hash&
Hash::hash(nonstd::span<const uint8_t> data)
{
  blake3_hasher_update(&m_hasher, data.data(), data.size());
  return *this;
}

tl::expected<void, std::string>
Hash::hash_fd(int fd)
{
  return util::read_fd(fd, [this](auto data) { hash(data); });
}

tl::expected<void, std::string>
Hash::hash_file(const fs::path& path)
{
  util::Fd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd) {
    const int open_errno = errno;
    LOG("Failed to open {}: {}", path, strerror(open_errno));
    return tl::unexpected(strerror(open_errno));
  }

  return hash_fd(*fd);
}
