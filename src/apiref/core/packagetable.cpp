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

#include "packagetable.hpp"

#include <apiref/core/exceptions.hpp>
#include <apiref/util/expected.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/string.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

namespace core {

bool
CaseInsensitiveLess::operator()(std::string_view lhs,
                                std::string_view rhs) const
{
  return std::lexicographical_compare(
    lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a))
             < std::tolower(static_cast<unsigned char>(b));
    });
}

tl::expected<PackageMap, std::string>
parse_package_list(std::string_view list)
{
  PackageMap result;
  for (const auto entry : util::split_into_views(list, ";")) {
    const auto stripped = util::strip_whitespace(entry);
    const auto [id, version] = util::split_once_into_views(stripped, ':');
    if (id.empty() || !version || version->empty()) {
      return tl::unexpected(
        FMT("invalid package entry \"{}\", expected id:version",
            entry));
    }
    result[std::string(id)] = std::string(*version);
  }
  return result;
}

PackageTable::PackageTable(PackageMap nswag_csharp,
                           PackageMap nswag_typescript)
  : m_nswag_csharp(std::move(nswag_csharp)),
    m_nswag_typescript(std::move(nswag_typescript))
{
}

PackageTable
PackageTable::builtin()
{
  return PackageTable(
    util::value_or_throw<core::Error>(
      parse_package_list(APIREF_PACKAGES_NSWAG_CSHARP), "NSwagCSharp: "),
    util::value_or_throw<core::Error>(
      parse_package_list(APIREF_PACKAGES_NSWAG_TYPESCRIPT),
      "NSwagTypeScript: "));
}

const PackageMap&
PackageTable::packages(CodeGenerator generator) const
{
  switch (generator) {
  case CodeGenerator::nswag_csharp:
    return m_nswag_csharp;
  case CodeGenerator::nswag_typescript:
    return m_nswag_typescript;
  }
  return m_nswag_csharp;
}

} // namespace core
