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

#include "config.hpp"

#include <apiref/core/atomicfile.hpp>
#include <apiref/core/exceptions.hpp>
#include <apiref/net/url.hpp>
#include <apiref/util/configreader.hpp>
#include <apiref/util/environment.hpp>
#include <apiref/util/expected.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/path.hpp>
#include <apiref/util/string.hpp>

#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

extern char** environ;

namespace fs = util::filesystem;

namespace {

enum class ConfigItem {
  code_generator,
  connect_timeout,
  install_command,
  install_timeout,
  log_file,
  operation_timeout,
  package_version_url,
  project_extension,
};

const std::unordered_map<std::string, ConfigItem> k_config_key_table = {
  {"code_generator", ConfigItem::code_generator},
  {"connect_timeout", ConfigItem::connect_timeout},
  {"install_command", ConfigItem::install_command},
  {"install_timeout", ConfigItem::install_timeout},
  {"log_file", ConfigItem::log_file},
  {"operation_timeout", ConfigItem::operation_timeout},
  {"package_version_url", ConfigItem::package_version_url},
  {"project_extension", ConfigItem::project_extension},
};

const std::unordered_map<std::string, std::string> k_env_variable_table = {
  {"CODE_GENERATOR", "code_generator"},
  {"CONNECT_TIMEOUT", "connect_timeout"},
  {"INSTALL_COMMAND", "install_command"},
  {"INSTALL_TIMEOUT", "install_timeout"},
  {"LOGFILE", "log_file"},
  {"OPERATION_TIMEOUT", "operation_timeout"},
  {"PACKAGE_VERSION_URL", "package_version_url"},
  {"PROJECT_EXTENSION", "project_extension"},
};

core::CodeGenerator
parse_code_generator_value(const std::string& value)
{
  const auto generator = core::parse_code_generator(value);
  if (!generator) {
    throw core::ValidationError(
      FMT("Invalid value '{}' given as code generator.", value));
  }
  return *generator;
}

uint64_t
parse_timeout(const std::string& value, std::string_view description)
{
  return util::value_or_throw<core::Error>(util::parse_unsigned(
    value, 1, std::numeric_limits<uint32_t>::max(), description));
}

std::string
parse_url_value(const std::string& value)
{
  // The empty string means "don't look up package versions remotely".
  if (!value.empty() && !net::is_remote_url(value)) {
    throw core::Error(FMT("not an http or https URL: \"{}\"", value));
  }
  return value;
}

// Call `item_handler` for each item in `text`. Errors are reported with line
// numbers relative to `path`.
void
for_each_config_item(
  const fs::path& path,
  std::string_view text,
  const std::function<void(const util::ConfigReader::Item& item)>& item_handler)
{
  util::ConfigReader reader(text);
  while (true) {
    const auto item = reader.read_next_item();
    if (!item) {
      throw core::Error(
        FMT("{}:{}: {}", path, item.error().line_number, item.error().message));
    }
    if (!*item) {
      break;
    }
    try {
      item_handler(**item);
    } catch (const core::Error& e) {
      throw core::Error(FMT("{}:{}: {}", path, (*item)->line_number, e.what()));
    }
  }
}

fs::path
home_directory()
{
  auto home = util::getenv_path("HOME");
  if (home) {
    return *home;
  }
  struct passwd* pwd = getpwuid(getuid());
  if (pwd) {
    return pwd->pw_dir;
  }
  throw core::Fatal(
    "Could not determine home directory from $HOME or getpwuid(3)");
}

} // namespace

void
Config::read()
{
  auto env_configpath = util::getenv_path("APIREF_CONFIGPATH");
  if (env_configpath) {
    set_config_path(*env_configpath);
  } else {
    auto env_xdg_config_home = util::getenv_path("XDG_CONFIG_HOME");
    const fs::path config_dir = env_xdg_config_home
                                  ? *env_xdg_config_home / "apiref"
                                  : home_directory() / ".config/apiref";
    set_config_path(config_dir / "apiref.conf");
  }

  // A missing configuration file is OK so don't check return value.
  update_from_file(config_path());
  update_from_environment();
}

void
Config::set_config_path(const fs::path& path)
{
  m_config_path = util::lexically_normal(path);
}

bool
Config::update_from_file(const fs::path& path)
{
  if (!fs::is_regular_file(path)) {
    return false;
  }
  const auto text = util::value_or_throw<core::Error>(
    util::read_file(path), FMT("failed to read {}: ", path));
  for_each_config_item(path, text, [&](const auto& item) {
    set_item(std::string(item.key), item.value, path.string());
  });
  return true;
}

void
Config::update_from_map(const std::unordered_map<std::string, std::string>& map)
{
  for (const auto& [key, value] : map) {
    try {
      set_item(key, value, "command line");
    } catch (const core::Error& e) {
      throw core::Error(
        FMT("when parsing command line config \"{}\": {}", key, e.what()));
    }
  }
}

void
Config::update_from_environment()
{
  for (char** env = environ; *env; ++env) {
    std::string setting = *env;
    const std::string prefix = "APIREF_";
    if (!util::starts_with(setting, prefix)) {
      continue;
    }
    size_t equal_pos = setting.find('=');
    if (equal_pos == std::string::npos) {
      continue;
    }

    std::string key = setting.substr(prefix.size(), equal_pos - prefix.size());
    std::string value = setting.substr(equal_pos + 1);

    auto it = k_env_variable_table.find(key);
    if (it == k_env_variable_table.end()) {
      // Ignore unknown keys.
      continue;
    }

    try {
      set_item(it->second, value, "environment");
    } catch (const core::Error& e) {
      throw core::Error(FMT("APIREF_{}: {}", key, e.what()));
    }
  }
}

std::string
Config::get_string_value(const std::string& key) const
{
  auto it = k_config_key_table.find(key);
  if (it == k_config_key_table.end()) {
    throw core::Error(FMT("unknown configuration option \"{}\"", key));
  }

  switch (it->second) {
  case ConfigItem::code_generator:
    return std::string(core::to_string(m_code_generator));

  case ConfigItem::connect_timeout:
    return FMT("{}", m_connect_timeout.count());

  case ConfigItem::install_command:
    return m_install_command;

  case ConfigItem::install_timeout:
    return FMT("{}", m_install_timeout.count());

  case ConfigItem::log_file:
    return m_log_file.string();

  case ConfigItem::operation_timeout:
    return FMT("{}", m_operation_timeout.count());

  case ConfigItem::package_version_url:
    return m_package_version_url;

  case ConfigItem::project_extension:
    return m_project_extension;
  }

  return {};
}

void
Config::set_value_in_file(const fs::path& path,
                          const std::string& key,
                          const std::string& value) const
{
  if (k_config_key_table.find(key) == k_config_key_table.end()) {
    throw core::Error(FMT("unknown configuration option \"{}\"", key));
  }

  // Verify that the value is valid; set_item will throw if not.
  Config dummy_config;
  dummy_config.set_item(key, value, "");

  std::string text;
  if (fs::is_regular_file(path)) {
    text = util::value_or_throw<core::Error>(util::read_file(path),
                                             FMT("failed to read {}: ", path));
  } else if (!path.parent_path().empty()) {
    util::throw_on_error<core::Error>(
      fs::create_directories(path.parent_path()),
      FMT("failed to create {}: ", path.parent_path()));
  }

  // Replace the existing entry including its continuation lines, keeping
  // everything else.
  std::optional<std::pair<size_t, size_t>> existing;
  util::ConfigReader reader(text);
  while (true) {
    const auto item = reader.read_next_raw_item();
    if (!item) {
      throw core::Error(
        FMT("{}:{}: {}", path, item.error().line_number, item.error().message));
    }
    if (!*item) {
      break;
    }
    if ((*item)->key == key) {
      existing = std::make_pair((*item)->line_start_pos,
                                (*item)->value_start_pos
                                  + (*item)->value_length);
    }
  }

  const auto new_line = FMT("{} = {}", key, value);
  if (existing) {
    text.replace(existing->first, existing->second - existing->first, new_line);
  } else {
    if (!text.empty() && text.back() != '\n') {
      text += '\n';
    }
    text += new_line;
    text += '\n';
  }

  core::AtomicFile output(path);
  output.write(text);
  output.commit();
}

void
Config::visit_items(const ItemVisitor& item_visitor) const
{
  std::vector<std::string> keys;
  keys.reserve(k_config_key_table.size());

  for (const auto& [key, item] : k_config_key_table) {
    keys.emplace_back(key);
  }
  std::sort(keys.begin(), keys.end());
  for (const auto& key : keys) {
    auto it = m_origins.find(key);
    std::string origin = it != m_origins.end() ? it->second : "default";
    item_visitor(key, get_string_value(key), origin);
  }
}

void
Config::set_item(const std::string& key,
                 const std::string& value,
                 const std::string& origin)
{
  auto it = k_config_key_table.find(key);
  if (it == k_config_key_table.end()) {
    // Ignore unknown keys.
    return;
  }

  switch (it->second) {
  case ConfigItem::code_generator:
    m_code_generator = parse_code_generator_value(value);
    break;

  case ConfigItem::connect_timeout:
    m_connect_timeout =
      std::chrono::milliseconds(parse_timeout(value, "connect_timeout"));
    break;

  case ConfigItem::install_command:
    if (value.empty()) {
      throw core::Error("install_command must not be empty");
    }
    m_install_command = value;
    break;

  case ConfigItem::install_timeout:
    m_install_timeout =
      std::chrono::seconds(parse_timeout(value, "install_timeout"));
    break;

  case ConfigItem::log_file:
    m_log_file = value;
    break;

  case ConfigItem::operation_timeout:
    m_operation_timeout =
      std::chrono::milliseconds(parse_timeout(value, "operation_timeout"));
    break;

  case ConfigItem::package_version_url:
    m_package_version_url = parse_url_value(value);
    break;

  case ConfigItem::project_extension:
    if (value.empty() || value[0] != '.') {
      throw core::Error(
        FMT("project_extension must start with a dot: \"{}\"", value));
    }
    m_project_extension = value;
    break;
  }

  m_origins.insert_or_assign(key, origin);
}

void
Config::check_key_tables_consistency()
{
  for (const auto& [key, value] : k_env_variable_table) {
    if (k_config_key_table.find(value) == k_config_key_table.end()) {
      throw core::Error(
        FMT("env var {} mapped to {} which is missing from k_config_key_table",
            key,
            value));
    }
  }
}
