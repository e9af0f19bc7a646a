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

#include <apiref/core/codegenerator.hpp>

#include <tl/expected.hpp>

#include <map>
#include <string>
#include <string_view>

namespace core {

struct CaseInsensitiveLess
{
  bool operator()(std::string_view lhs, std::string_view rhs) const;
};

// Package id -> version. Ids are compared case-insensitively.
using PackageMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// Parse a package list of the form "id:version;id:version". A later entry
// replaces an earlier one with the same id.
tl::expected<PackageMap, std::string> parse_package_list(std::string_view list);

// Immutable table of the packages each code generator needs, used when the
// remote package version document is unavailable.
class PackageTable
{
public:
  PackageTable(PackageMap nswag_csharp, PackageMap nswag_typescript);

  // Return the table compiled into the binary. Throws core::Error if the
  // compiled-in lists are malformed.
  static PackageTable builtin();

  const PackageMap& packages(CodeGenerator generator) const;

private:
  PackageMap m_nswag_csharp;
  PackageMap m_nswag_typescript;
};

} // namespace core
