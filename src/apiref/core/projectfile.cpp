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

#include "projectfile.hpp"

#include <apiref/core/atomicfile.hpp>
#include <apiref/core/exceptions.hpp>
#include <apiref/util/configreader.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>
#include <apiref/util/path.hpp>
#include <apiref/util/string.hpp>

#include <algorithm>

namespace fs = std::filesystem;

namespace core {

std::optional<std::string>
ProjectItem::metadata_value(std::string_view name) const
{
  for (const auto& [key, value] : metadata) {
    if (key == name) {
      return value;
    }
  }
  return std::nullopt;
}

ProjectFile::ProjectFile(fs::path path, std::string text)
  : m_path(std::move(path)),
    m_text(std::move(text))
{
  parse();
}

ProjectFile
ProjectFile::load(const fs::path& path)
{
  auto text = util::read_file(path);
  if (!text) {
    throw core::Error(FMT("Failed to read {}: {}", path, text.error()));
  }
  return ProjectFile(path, std::move(*text));
}

void
ProjectFile::reload()
{
  auto text = util::read_file(m_path);
  if (!text) {
    throw core::Error(FMT("Failed to read {}: {}", m_path, text.error()));
  }
  m_text = std::move(*text);
  parse();
}

void
ProjectFile::parse()
{
  m_entries.clear();

  util::ConfigReader reader(m_text);
  while (true) {
    auto raw_item = reader.read_next_raw_item();
    if (!raw_item) {
      throw core::Error(FMT("{}:{}: {}",
                            m_path,
                            raw_item.error().line_number,
                            raw_item.error().message));
    }
    if (!*raw_item) {
      break;
    }
    const auto& raw = **raw_item;
    if (raw.key.empty()) {
      throw core::Error(FMT("{}:{}: missing item type", m_path, raw.line_number));
    }

    Entry entry;
    entry.item.tag = std::string(raw.key);
    entry.begin = raw.line_start_pos;
    entry.end = raw.value_start_pos + raw.value_length;

    const auto lines = util::split_into_views(
      std::string_view(m_text).substr(raw.value_start_pos, raw.value_length),
      "\n",
      util::SplitMode::include_empty);
    entry.item.include = util::strip_whitespace(lines.front());
    if (entry.item.include.empty()) {
      throw core::Error(FMT("{}:{}: missing include path for {}",
                            m_path,
                            raw.line_number,
                            raw.key));
    }

    for (size_t i = 1; i < lines.size(); ++i) {
      if (util::is_comment_or_blank(lines[i])) {
        continue;
      }
      const auto [name, value] = util::split_once_into_views(lines[i], '=');
      if (!value) {
        throw core::Error(FMT("{}:{}: missing equal sign in metadata",
                              m_path,
                              raw.line_number + i));
      }
      entry.item.metadata.emplace_back(util::strip_whitespace(name),
                                       util::strip_whitespace(*value));
    }

    m_entries.push_back(std::move(entry));
  }
}

std::vector<ProjectItem>
ProjectFile::get_items(std::string_view tag) const
{
  std::vector<ProjectItem> result;
  for (const auto& entry : m_entries) {
    if (entry.item.tag == tag) {
      result.push_back(entry.item);
    }
  }
  return result;
}

void
ProjectFile::add_item(const std::string& tag,
                      const std::string& include,
                      const Metadata& metadata)
{
  std::string text;
  if (!m_text.empty() && m_text.back() != '\n') {
    text += '\n';
  }
  text += FMT("{} = {}\n", tag, include);
  for (const auto& [name, value] : metadata) {
    text += FMT("  {} = {}\n", name, value);
  }

  const auto old_text = m_text;
  m_text += text;
  try {
    parse();
  } catch (const core::Error&) {
    m_text = old_text;
    parse();
    throw;
  }
  LOG("Added {} {} to {}", tag, include, m_path);
  save();
}

std::vector<ProjectItem>
ProjectFile::remove_items(
  std::string_view tag,
  const std::function<bool(const ProjectItem&)>& predicate)
{
  std::vector<ProjectItem> removed;
  // Erase from the back so that earlier offsets stay valid.
  for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it) {
    if (it->item.tag != tag || !predicate(it->item)) {
      continue;
    }
    size_t end = it->end;
    while (end < m_text.size() && m_text[end] != '\n') {
      ++end;
    }
    if (end < m_text.size()) {
      ++end; // the newline
    }
    m_text.erase(it->begin, end - it->begin);
    LOG("Removed {} {} from {}", it->item.tag, it->item.include, m_path);
    removed.push_back(it->item);
  }

  if (!removed.empty()) {
    std::reverse(removed.begin(), removed.end());
    parse();
    save();
  }
  return removed;
}

void
ProjectFile::save() const
{
  AtomicFile file(m_path);
  file.write(m_text);
  file.commit();
}

fs::path
resolve_project_file(const std::optional<std::string>& explicit_project,
                     const fs::path& working_dir,
                     std::string_view extension)
{
  if (explicit_project) {
    const auto path = util::make_absolute(*explicit_project, working_dir);
    if (!util::filesystem::is_regular_file(path)) {
      throw ValidationError(FMT("The project '{}' does not exist.", path));
    }
    return path;
  }

  std::vector<fs::path> projects;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(working_dir, ec)) {
    std::error_code entry_ec;
    if (entry.is_regular_file(entry_ec)
        && util::ends_with(entry.path().filename().string(), extension)) {
      projects.push_back(entry.path());
    }
  }
  if (ec) {
    throw core::Error(FMT("Failed to list {}: {}", working_dir, ec.message()));
  }

  if (projects.empty()) {
    throw ValidationError(
      "No project files were found in the current directory. Either move to a"
      " new directory or provide the project explicitly");
  }
  if (projects.size() > 1) {
    throw ValidationError(
      "More than one project was found in this directory, either remove a"
      " duplicate or explicitly provide the project.");
  }
  return projects.front();
}

} // namespace core
