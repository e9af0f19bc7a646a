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

#include <cstdint>
#include <filesystem>
#include <system_error>

// Non-throwing wrappers of std::filesystem functions, returning
// tl::expected<T, std::error_code> instead of taking an std::error_code
// out-parameter.
namespace util::filesystem {

using directory_iterator = std::filesystem::directory_iterator;
using path = std::filesystem::path;

// Define wrapper with no parameters returning non-void result.
#define DEF_WRAP_0_R(name_, r_)                                                \
  inline tl::expected<r_, std::error_code> name_()                             \
  {                                                                            \
    std::error_code ec_;                                                       \
    auto result_ = std::filesystem::name_(ec_);                                \
    if (ec_) {                                                                 \
      return tl::unexpected(ec_);                                              \
    }                                                                          \
    return result_;                                                            \
  }

// Define wrapper with one parameter returning non-void result.
#define DEF_WRAP_1_R(name_, r_, t1_, p1_)                                      \
  inline tl::expected<r_, std::error_code> name_(t1_ p1_)                      \
  {                                                                            \
    std::error_code ec_;                                                       \
    auto result_ = std::filesystem::name_(p1_, ec_);                           \
    if (ec_) {                                                                 \
      return tl::unexpected(ec_);                                              \
    }                                                                          \
    return result_;                                                            \
  }

// Define predicate wrapper with one parameter. Returns true if there's no error
// and the wrapped function returned true.
#define DEF_WRAP_1_P(name_, r_, t1_, p1_)                                      \
  inline r_ name_(t1_ p1_)                                                     \
  {                                                                            \
    std::error_code ec_;                                                       \
    auto result_ = std::filesystem::name_(p1_, ec_);                           \
    return !ec_ && result_;                                                    \
  }

// Define wrapper with one parameter returning void.
#define DEF_WRAP_1_V(name_, r_, t1_, p1_)                                      \
  inline tl::expected<r_, std::error_code> name_(t1_ p1_)                      \
  {                                                                            \
    std::error_code ec_;                                                       \
    std::filesystem::name_(p1_, ec_);                                          \
    if (ec_) {                                                                 \
      return tl::unexpected(ec_);                                              \
    }                                                                          \
    return {};                                                                 \
  }

// clang-format off

//           name,                ret,            pt1,         pn1
DEF_WRAP_1_R(canonical,           path,           const path&, p)
DEF_WRAP_1_R(create_directories,  bool,           const path&, p)
DEF_WRAP_0_R(current_path,        path)
DEF_WRAP_1_V(current_path,        void,           const path&, p)
DEF_WRAP_1_P(exists,              bool,           const path&, p)
DEF_WRAP_1_P(is_directory,        bool,           const path&, p)
DEF_WRAP_1_P(is_regular_file,     bool,           const path&, p)
DEF_WRAP_1_R(remove,              bool,           const path&, p)
DEF_WRAP_1_R(remove_all,          std::uintmax_t, const path&, p)

// clang-format on

#undef DEF_WRAP_0_R
#undef DEF_WRAP_1_R
#undef DEF_WRAP_1_P
#undef DEF_WRAP_1_V

tl::expected<void, std::error_code> rename(const path& old_p,
                                           const path& new_p);

} // namespace util::filesystem
