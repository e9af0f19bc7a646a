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
#include <apiref/core/packagetable.hpp>

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace net {
class Downloader;
}

namespace core {

// Determines the packages a code generator needs. The remote package version
// document is preferred; the built-in table is used if it cannot be retrieved
// or parsed.
class PackageVersionResolver
{
public:
  PackageVersionResolver(net::Downloader& downloader,
                         std::string version_document_url,
                         const PackageTable& table);

  // Never fails. A remote document that parses but has no packages is used as
  // is.
  PackageMap resolve(CodeGenerator generator);

  // Parse a package version document of the form
  // {"Version": "...", "Packages": {"id": "version", ...}}.
  static tl::expected<PackageMap, std::string>
  parse_version_document(std::string_view document);

private:
  net::Downloader& m_downloader;
  std::string m_version_document_url;
  const PackageTable& m_table;

  tl::expected<PackageMap, std::string> fetch_remote();
};

} // namespace core
