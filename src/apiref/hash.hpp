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

#include <blake3.h>
#include <nonstd/span.hpp>
#include <tl/expected.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

// This class represents a hash state used to compare file contents.
class Hash
{
public:
  using Digest = std::array<uint8_t, 32>;

  Hash();
  Hash(const Hash& other) = default;

  Hash& operator=(const Hash& other) = default;

  // Retrieve the digest.
  Digest digest() const;

  // Add data to the hash.
  Hash& hash(nonstd::span<const uint8_t> data);
  Hash& hash(std::string_view data);

  // Add file contents to the hash.
  tl::expected<void, std::string> hash_file(const std::filesystem::path& path);

  // Add contents read from an open file descriptor to the hash.
  tl::expected<void, std::string> hash_fd(int fd);

private:
  blake3_hasher m_hasher;
};

inline Hash&
Hash::hash(std::string_view data)
{
  return hash(nonstd::span<const uint8_t>(
    reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}
