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

#include <apiref/core/projectfile.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Kind of reference: the item tag and the metadata that holds the source
// identity.
struct ReferenceKind
{
  std::string_view tag;
  std::string_view identity_metadata;
};

const ReferenceKind k_url_reference{"OpenApiReference", "SourceUrl"};
const ReferenceKind k_project_reference{"OpenApiProjectReference",
                                        "SourceProject"};

enum class RegisterResult { added, duplicate_path, duplicate_identity };

// Keeps at most one reference per local path and per source identity for each
// kind of reference in a project file. The project file is re-read before each
// mutation.
class ReferenceStore
{
public:
  // Local paths are compared after being made absolute against `base_dir`.
  ReferenceStore(ProjectFile& project, std::filesystem::path base_dir);

  RegisterResult
  register_reference(const ReferenceKind& kind,
                     const std::string& local_path,
                     const std::optional<std::string>& source_identity,
                     const Metadata& extra_metadata = {});

  // Return the reference of `kind` whose source identity is `identity`.
  std::optional<ProjectItem> find_by_identity(const ReferenceKind& kind,
                                              std::string_view identity) const;

  // Remove all references of `kind` whose local path or source identity
  // matches `source`. Returns the removed references.
  std::vector<ProjectItem> remove_references(const ReferenceKind& kind,
                                             const std::string& source);

  const std::filesystem::path& project_path() const;

private:
  ProjectFile& m_project;
  std::filesystem::path m_base_dir;

  std::filesystem::path normalize(std::string_view local_path) const;
};

inline const std::filesystem::path&
ReferenceStore::project_path() const
{
  return m_project.path();
}

} // namespace core
