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
#include <apiref/util/noncopyable.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>

class Config : util::NonCopyable
{
public:
  Config() = default;

  // Read the configuration file and the environment.
  void read();

  core::CodeGenerator code_generator() const;
  const std::string& install_command() const;
  std::chrono::seconds install_timeout() const;
  const std::string& package_version_url() const;
  std::chrono::milliseconds connect_timeout() const;
  std::chrono::milliseconds operation_timeout() const;
  const std::string& project_extension() const;
  const std::filesystem::path& log_file() const;

  const std::filesystem::path& config_path() const;

  void set_config_path(const std::filesystem::path& path);
  void set_log_file(const std::filesystem::path& value);

  // Return false if `path` does not exist. Throws core::Error on malformed
  // content.
  bool update_from_file(const std::filesystem::path& path);

  void update_from_map(const std::unordered_map<std::string, std::string>& map);

  void update_from_environment();

  std::string get_string_value(const std::string& key) const;

  void set_value_in_file(const std::filesystem::path& path,
                         const std::string& key,
                         const std::string& value) const;

  // Called for each configuration key in alphabetical order with the key, the
  // current value and where the value came from.
  using ItemVisitor = std::function<void(const std::string& key,
                                         const std::string& value,
                                         const std::string& origin)>;

  void visit_items(const ItemVisitor& item_visitor) const;

  // Verify that all environment variables map to configuration keys.
  static void check_key_tables_consistency();

private:
  std::filesystem::path m_config_path;

  core::CodeGenerator m_code_generator = core::CodeGenerator::nswag_csharp;
  std::string m_install_command = "dotnet";
  std::chrono::seconds m_install_timeout{20};
  std::string m_package_version_url =
    "https://go.microsoft.com/fwlink/?linkid=2099561";
  std::chrono::milliseconds m_connect_timeout{5000};
  std::chrono::milliseconds m_operation_timeout{30000};
  std::string m_project_extension = ".apiproj";
  std::filesystem::path m_log_file;

  std::unordered_map<std::string /*key*/, std::string /*origin*/> m_origins;

  void set_item(const std::string& key,
                const std::string& value,
                const std::string& origin);
};

// Implementation

inline core::CodeGenerator
Config::code_generator() const
{
  return m_code_generator;
}

inline const std::string&
Config::install_command() const
{
  return m_install_command;
}

inline std::chrono::seconds
Config::install_timeout() const
{
  return m_install_timeout;
}

inline const std::string&
Config::package_version_url() const
{
  return m_package_version_url;
}

inline std::chrono::milliseconds
Config::connect_timeout() const
{
  return m_connect_timeout;
}

inline std::chrono::milliseconds
Config::operation_timeout() const
{
  return m_operation_timeout;
}

inline const std::string&
Config::project_extension() const
{
  return m_project_extension;
}

inline const std::filesystem::path&
Config::log_file() const
{
  return m_log_file;
}

inline const std::filesystem::path&
Config::config_path() const
{
  return m_config_path;
}

inline void
Config::set_log_file(const std::filesystem::path& value)
{
  m_log_file = value;
  m_origins["log_file"] = "command line";
}
