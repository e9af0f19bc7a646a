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

#include "packageresolver.hpp"

#include <apiref/net/downloader.hpp>
#include <apiref/util/expected.hpp>
#include <apiref/util/json.hpp>
#include <apiref/util/logging.hpp>

#include <utility>

namespace core {

PackageVersionResolver::PackageVersionResolver(
  net::Downloader& downloader,
  std::string version_document_url,
  const PackageTable& table)
  : m_downloader(downloader),
    m_version_document_url(std::move(version_document_url)),
    m_table(table)
{
}

PackageMap
PackageVersionResolver::resolve(CodeGenerator generator)
{
  if (!m_version_document_url.empty()) {
    auto remote = fetch_remote();
    if (remote) {
      LOG("Using {} package(s) from {}",
          remote->size(),
          m_version_document_url);
      return std::move(*remote);
    }
    LOG("Failed to retrieve package versions: {}", remote.error());
  }

  LOG("Using built-in package versions for {}", to_string(generator));
  return m_table.packages(generator);
}

tl::expected<PackageMap, std::string>
PackageVersionResolver::parse_version_document(std::string_view document)
{
  util::SimpleJsonParser parser(document);
  TRY_ASSIGN(const auto members, parser.get_string_members(".Packages"));

  PackageMap result;
  for (const auto& [id, version] : members) {
    // Last writer wins, also for ids differing only in case.
    result.erase(id);
    result.emplace(id, version);
  }
  return result;
}

tl::expected<PackageMap, std::string>
PackageVersionResolver::fetch_remote()
{
  std::string document;
  const auto response = m_downloader.get(
    m_version_document_url, [&](nonstd::span<const uint8_t> data) {
      document.append(reinterpret_cast<const char*>(data.data()), data.size());
      return true;
    });
  if (!response) {
    return tl::unexpected(response.error().message);
  }
  return parse_version_document(document);
}

} // namespace core
