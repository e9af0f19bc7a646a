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

#include <apiref/core/registration.hpp>

#include <optional>
#include <string>

class Config;

struct CommandOptions
{
  std::optional<std::string> project;
  std::optional<std::string> code_generator;
  std::optional<std::string> output_file;
};

// Add a reference to an OpenAPI document, a local OpenAPI file or a project.
// Returns the process exit status.
int add_reference(const Config& config,
                  core::SourceKind kind,
                  const std::string& source,
                  const CommandOptions& options);

// Remove references whose local path or source matches `source`.
int remove_reference(const Config& config,
                     const std::string& source,
                     const CommandOptions& options);

// Download the document of the reference with source URL `source_url` again,
// overwriting the local copy.
int refresh_reference(const Config& config,
                      const std::string& source_url,
                      const CommandOptions& options);
