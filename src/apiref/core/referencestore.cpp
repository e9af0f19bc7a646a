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

#include "referencestore.hpp"

#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>
#include <apiref/util/path.hpp>

namespace fs = std::filesystem;

namespace core {

ReferenceStore::ReferenceStore(ProjectFile& project, fs::path base_dir)
  : m_project(project),
    m_base_dir(std::move(base_dir))
{
}

fs::path
ReferenceStore::normalize(std::string_view local_path) const
{
  return util::make_absolute(fs::path(local_path), m_base_dir);
}

RegisterResult
ReferenceStore::register_reference(
  const ReferenceKind& kind,
  const std::string& local_path,
  const std::optional<std::string>& source_identity,
  const Metadata& extra_metadata)
{
  m_project.reload();
  const auto items = m_project.get_items(kind.tag);

  const auto normalized_path = normalize(local_path);
  for (const auto& item : items) {
    if (normalize(item.include) == normalized_path) {
      LOG("{} {} is already registered in {}",
          kind.tag,
          normalized_path,
          m_project.path());
      return RegisterResult::duplicate_path;
    }
  }

  const bool has_identity = source_identity && !source_identity->empty();
  if (has_identity) {
    for (const auto& item : items) {
      if (item.metadata_value(kind.identity_metadata) == *source_identity) {
        LOG("{} with {} {} is already registered in {}",
            kind.tag,
            kind.identity_metadata,
            *source_identity,
            m_project.path());
        return RegisterResult::duplicate_identity;
      }
    }
  }

  Metadata metadata;
  if (has_identity) {
    metadata.emplace_back(std::string(kind.identity_metadata),
                          *source_identity);
  }
  metadata.insert(metadata.end(), extra_metadata.begin(), extra_metadata.end());
  m_project.add_item(std::string(kind.tag), local_path, metadata);
  return RegisterResult::added;
}

std::optional<ProjectItem>
ReferenceStore::find_by_identity(const ReferenceKind& kind,
                                 std::string_view identity) const
{
  for (auto& item : m_project.get_items(kind.tag)) {
    if (item.metadata_value(kind.identity_metadata) == identity) {
      return std::move(item);
    }
  }
  return std::nullopt;
}

std::vector<ProjectItem>
ReferenceStore::remove_references(const ReferenceKind& kind,
                                  const std::string& source)
{
  m_project.reload();
  const auto normalized_source = normalize(source);
  return m_project.remove_items(kind.tag, [&](const ProjectItem& item) {
    return normalize(item.include) == normalized_source
           || item.metadata_value(kind.identity_metadata) == source;
  });
}

} // namespace core
