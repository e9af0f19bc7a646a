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

#include "codegenerator.hpp"

namespace core {

std::optional<CodeGenerator>
parse_code_generator(std::string_view name)
{
  if (name == "NSwagCSharp") {
    return CodeGenerator::nswag_csharp;
  } else if (name == "NSwagTypeScript") {
    return CodeGenerator::nswag_typescript;
  } else {
    return std::nullopt;
  }
}

std::string_view
to_string(CodeGenerator generator)
{
  switch (generator) {
  case CodeGenerator::nswag_csharp:
    return "NSwagCSharp";
  case CodeGenerator::nswag_typescript:
    return "NSwagTypeScript";
  }
  return {};
}

} // namespace core
