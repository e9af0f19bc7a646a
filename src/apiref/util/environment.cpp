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

#include "environment.hpp"

#include <apiref/util/string.hpp>

#include <cstdlib>

namespace util {

std::optional<std::filesystem::path>
getenv_path(const char* name)
{
  const char* value = getenv(name);
  return value ? std::optional<std::filesystem::path>(value) : std::nullopt;
}

std::vector<std::filesystem::path>
getenv_path_list(const char* name)
{
  const char* value = getenv(name);
  if (!value) {
    return {};
  }

  std::vector<std::filesystem::path> result;
  for (const auto part : split_into_views(value, ":")) {
    result.emplace_back(part);
  }
  return result;
}

void
setenv(const std::string& name, const std::string& value)
{
  ::setenv(name.c_str(), value.c_str(), true);
}

void
unsetenv(const std::string& name)
{
  ::unsetenv(name.c_str());
}

} // namespace util
