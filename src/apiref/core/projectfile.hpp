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
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace core {

using Metadata = std::vector<std::pair<std::string, std::string>>;

struct ProjectItem
{
  std::string tag;
  std::string include;
  Metadata metadata;

  // Return the value of metadata `name`, or nullopt if absent.
  std::optional<std::string> metadata_value(std::string_view name) const;
};

// A project file listing items, one per non-indented "Tag = include" line,
// with indented "Name = value" metadata lines:
//
//   # comment
//   OpenApiReference = openapi/openapi.json
//     SourceUrl = https://example.com/openapi.json
//
// Text that is not part of a modified item, comments included, is preserved
// when the file is written. Each mutation is written to disk immediately, on
// top of the text last read.
// Throws core::Error on read, parse and write errors.
class ProjectFile
{
public:
  static ProjectFile load(const std::filesystem::path& path);

  const std::filesystem::path& path() const;

  // Read the file again, picking up changes made by other programs.
  void reload();

  std::vector<ProjectItem> get_items(std::string_view tag) const;

  void add_item(const std::string& tag,
                const std::string& include,
                const Metadata& metadata);

  // Remove all items with `tag` for which `predicate` returns true. Returns the
  // removed items.
  std::vector<ProjectItem>
  remove_items(std::string_view tag,
               const std::function<bool(const ProjectItem&)>& predicate);

  void save() const;

private:
  struct Entry
  {
    ProjectItem item;
    size_t begin; // offset of the "Tag = include" line
    size_t end;   // offset just past the last metadata line
  };

  std::filesystem::path m_path;
  std::string m_text;
  std::vector<Entry> m_entries;

  ProjectFile(std::filesystem::path path, std::string text);

  void parse();
};

// Return the project file to operate on: `explicit_project` made absolute
// against `working_dir` if given, otherwise the only file in `working_dir`
// whose name ends with `extension`. Throws core::ValidationError.
std::filesystem::path
resolve_project_file(const std::optional<std::string>& explicit_project,
                     const std::filesystem::path& working_dir,
                     std::string_view extension);

inline const std::filesystem::path&
ProjectFile::path() const
{
  return m_path;
}

} // namespace core
