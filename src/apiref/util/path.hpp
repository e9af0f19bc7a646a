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

#include <filesystem>

namespace util {

// --- Interface ---

// Return lexically normal `path` without trailing slash.
std::filesystem::path lexically_normal(const std::filesystem::path& path);

// Return `path` unchanged if it is absolute, otherwise `base_dir / path`. The
// result is lexically normalized. Symlinks are not resolved.
std::filesystem::path make_absolute(const std::filesystem::path& path,
                                    const std::filesystem::path& base_dir);

} // namespace util
