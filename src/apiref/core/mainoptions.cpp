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

#include "mainoptions.hpp"

#include <apiref/commands.hpp>
#include <apiref/config.hpp>
#include <apiref/core/exceptions.hpp>
#include <apiref/core/registration.hpp>
#include <apiref/util/environment.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>
#include <apiref/util/string.hpp>

#include <getopt.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace core {

constexpr const char VERSION_TEXT[] =
  R"({0} version {1}

Copyright (C) 2026 The apiref authors

This program is free software; you can redistribute it and/or modify it under
the terms of the GNU General Public License as published by the Free Software
Foundation; either version 3 of the License, or (at your option) any later
version.
)";

constexpr const char USAGE_TEXT[] =
  R"(Usage:
    {0} [options] add url <source-URL> [command options]
    {0} [options] add file <path> [command options]
    {0} [options] add project <project-path> [command options]
    {0} [options] remove <source> [command options]
    {0} [options] refresh <source-URL> [command options]

Commands:
    add url        download an OpenAPI document and add a reference to it
    add file       add a reference to a local OpenAPI document
    add project    add a reference to another project
    remove         remove references whose path or source matches <source>
    refresh        download the document of a URL reference again

Command options:
    -c, --code-generator NAME  code generator to use (NSwagCSharp or
                               NSwagTypeScript); default: the code_generator
                               configuration option
        --output-file PATH     destination for the downloaded document (add
                               url only); default: openapi/openapi.json
    -p, --updateProject PATH   project file to operate on; default: the only
                               project file in the current directory

Options:
        --config-path PATH     operate on configuration file PATH instead of the
                               default
        --set-config KEY=VALUE set configuration option KEY to value VALUE in the
                               configuration file
        --show-config          show current configuration options in
                               human-readable format
    -v, --verbose              log to standard error

    -h, --help                 print this help text
    -V, --version              print version and copyright information
)";

static void
configuration_printer(const std::string& key,
                      const std::string& value,
                      const std::string& origin)
{
  PRINT(stdout, "({}) {} = {}\n", origin, key, value);
}

std::string
get_version_text(const std::string_view apiref_name)
{
  return FMT(VERSION_TEXT, apiref_name, APIREF_VERSION);
}

std::string
get_usage_text(const std::string_view apiref_name)
{
  return FMT(USAGE_TEXT, apiref_name);
}

enum : uint8_t {
  CONFIG_PATH,
  OUTPUT_FILE,
  SET_CONFIG,
  SHOW_CONFIG,
};

// "+" stops option processing at the command name.
const char options_string[] = "+hvV";
const option long_options[] = {
  {"config-path",    required_argument, nullptr, CONFIG_PATH },
  {"help",           no_argument,       nullptr, 'h'         },
  {"set-config",     required_argument, nullptr, SET_CONFIG  },
  {"show-config",    no_argument,       nullptr, SHOW_CONFIG },
  {"verbose",        no_argument,       nullptr, 'v'         },
  {"version",        no_argument,       nullptr, 'V'         },
  {nullptr,          0,                 nullptr, 0           }
};

const char command_options_string[] = "c:p:";
const option command_long_options[] = {
  {"code-generator", required_argument, nullptr, 'c'         },
  {"output-file",    required_argument, nullptr, OUTPUT_FILE },
  {"updateProject",  required_argument, nullptr, 'p'         },
  {nullptr,          0,                 nullptr, 0           }
};

namespace {

struct ParsedCommand
{
  std::vector<std::string> words; // command, subcommand and arguments
  CommandOptions options;
};

// Parse the arguments following the global options. Options and positional
// arguments may be mixed.
std::optional<ParsedCommand>
parse_command(const char* program_name, int argc, const char* const* argv)
{
  std::vector<const char*> args{program_name};
  args.insert(args.end(), argv, argv + argc);

  ParsedCommand result;
  optind = 0; // Reinitialize getopt, including the ordering mode.
  int c;
  while ((c = getopt_long(static_cast<int>(args.size()),
                          const_cast<char* const*>(args.data()),
                          command_options_string,
                          command_long_options,
                          nullptr))
         != -1) {
    const std::string arg = optarg ? optarg : std::string();

    switch (c) {
    case 'c': // --code-generator
      result.options.code_generator = arg;
      break;

    case 'p': // --updateProject
      result.options.project = arg;
      break;

    case OUTPUT_FILE:
      result.options.output_file = arg;
      break;

    case '?': // unknown option
    default:
      return std::nullopt;
    }
  }

  for (size_t i = static_cast<size_t>(optind); i < args.size(); ++i) {
    result.words.emplace_back(args[i]);
  }
  return result;
}

int
run_command(const Config& config,
            const ParsedCommand& command,
            std::string_view apiref_name)
{
  const auto& words = command.words;
  if (words.empty()) {
    PRINT_RAW(stderr, get_usage_text(apiref_name));
    return EXIT_FAILURE;
  }

  const auto missing_argument = [&](std::string_view name) {
    PRINT(stderr, "apiref: error: missing argument <{}>\n", name);
    PRINT_RAW(stderr, get_usage_text(apiref_name));
    return EXIT_FAILURE;
  };

  if (words[0] == "add") {
    if (words.size() < 2) {
      return missing_argument("url|file|project");
    }
    const auto& what = words[1];
    std::optional<SourceKind> kind;
    std::string_view argument_name;
    if (what == "url") {
      kind = SourceKind::url;
      argument_name = "source-URL";
    } else if (what == "file") {
      kind = SourceKind::file;
      argument_name = "path";
    } else if (what == "project") {
      kind = SourceKind::project;
      argument_name = "project-path";
    } else {
      throw ValidationError(FMT("unknown add command \"{}\"", what));
    }
    if (words.size() < 3) {
      return missing_argument(argument_name);
    }
    if (words.size() > 3) {
      throw ValidationError(FMT("unexpected argument \"{}\"", words[3]));
    }
    if (command.options.output_file && kind != SourceKind::url) {
      throw ValidationError("--output-file is only valid for add url");
    }
    return add_reference(config, *kind, words[2], command.options);
  }

  if (words[0] == "remove" || words[0] == "refresh") {
    if (words.size() < 2) {
      return missing_argument(words[0] == "remove" ? "source" : "source-URL");
    }
    if (words.size() > 2) {
      throw ValidationError(FMT("unexpected argument \"{}\"", words[2]));
    }
    if (command.options.output_file || command.options.code_generator) {
      throw ValidationError(
        FMT("only --updateProject is valid for {}", words[0]));
    }
    return words[0] == "remove"
             ? remove_reference(config, words[1], command.options)
             : refresh_reference(config, words[1], command.options);
  }

  throw ValidationError(FMT("unknown command \"{}\"", words[0]));
}

} // namespace

int
process_main_options(int argc, const char* const* argv)
{
  const auto apiref_name = std::filesystem::path(argv[0]).filename().string();

  bool verbose = false;
  std::vector<std::string> set_config_settings;
  bool show_config = false;

  optind = 0; // Reinitialize getopt.
  int c;
  while ((c = getopt_long(argc,
                          const_cast<char* const*>(argv),
                          options_string,
                          long_options,
                          nullptr))
         != -1) {
    const std::string arg = optarg ? optarg : std::string();

    switch (c) {
    case CONFIG_PATH:
      util::setenv("APIREF_CONFIGPATH", arg);
      break;

    case 'h': // --help
      PRINT_RAW(stdout, get_usage_text(apiref_name));
      return EXIT_SUCCESS;

    case SET_CONFIG:
      set_config_settings.push_back(arg);
      break;

    case SHOW_CONFIG:
      show_config = true;
      break;

    case 'v': // --verbose
      verbose = true;
      break;

    case 'V': // --version
      PRINT_RAW(stdout, get_version_text(apiref_name));
      return EXIT_SUCCESS;

    case '?': // unknown option
    default:
      return EXIT_FAILURE;
    }
  }

  Config config;
  config.read();
  if (verbose) {
    config.set_log_file("-");
  }
  util::logging::init(config.log_file());
  LOG("=== apiref {} ===", APIREF_VERSION);

  for (const auto& setting : set_config_settings) {
    // Start searching for equal sign at position 1 to improve error message
    // for the --set-config=K=V case (key "=K" and value "V").
    size_t eq_pos = setting.find('=', 1);
    if (eq_pos == std::string::npos) {
      throw Error(FMT("missing equal sign in \"{}\"", setting));
    }
    std::string key = setting.substr(0, eq_pos);
    std::string value = setting.substr(eq_pos + 1);
    config.set_value_in_file(config.config_path(), key, value);
  }
  if (!set_config_settings.empty()) {
    config.read();
    if (verbose) {
      config.set_log_file("-");
    }
  }

  if (show_config) {
    config.visit_items(configuration_printer);
  }

  if (optind >= argc) {
    if (!set_config_settings.empty() || show_config) {
      return EXIT_SUCCESS;
    }
    PRINT_RAW(stderr, get_usage_text(apiref_name));
    return EXIT_FAILURE;
  }

  const auto command = parse_command(argv[0], argc - optind, argv + optind);
  if (!command) {
    return EXIT_FAILURE;
  }
  return run_command(config, *command, apiref_name);
}

} // namespace core
