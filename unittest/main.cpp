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

#include <apiref/util/environment.hpp>
#include <apiref/util/expected.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <unistd.h>

#include <cstdlib>
#include <initializer_list>
#include <string>

namespace fs = util::filesystem;

tl::expected<int, std::error_code>
prepare_test(int argc, char** argv)
{
  auto dir_before = *fs::current_path();
  fs::path testdir = FMT("testdir/{}", getpid());

  TRY(fs::remove_all(testdir));
  TRY(fs::create_directories(testdir));
  TRY(fs::current_path(testdir));

  doctest::Context context;
  context.applyCommandLine(argc, argv);
  int result = context.run();

  if (result == EXIT_SUCCESS) {
    TRY(fs::current_path(dir_before));
    TRY(fs::remove_all(testdir));
  } else {
    PRINT(stderr, "Note: Test data has been left in {}\n", testdir);
  }

  return result;
}

int
main(int argc, char** argv)
{
  // Don't let the user's configuration leak into the tests.
  for (const char* name : {"APIREF_CONFIGPATH",
                           "APIREF_CODE_GENERATOR",
                           "APIREF_CONNECT_TIMEOUT",
                           "APIREF_INSTALL_COMMAND",
                           "APIREF_INSTALL_TIMEOUT",
                           "APIREF_LOGFILE",
                           "APIREF_OPERATION_TIMEOUT",
                           "APIREF_PACKAGE_VERSION_URL",
                           "APIREF_PROJECT_EXTENSION"}) {
    util::unsetenv(name);
  }

  auto result = prepare_test(argc, argv);
  if (result) {
    return *result;
  } else {
    PRINT(stderr, "error: {}\n", result.error());
    return EXIT_FAILURE;
  }
}
