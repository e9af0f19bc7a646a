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

#include "apiref.hpp"

#include <apiref/core/exceptions.hpp>
#include <apiref/core/mainoptions.hpp>
#include <apiref/util/format.hpp>

#include <cstdlib>

int
apiref_main(int argc, const char* const* argv)
{
  try {
    return core::process_main_options(argc, argv);
  } catch (const core::InstallError& e) {
    PRINT_RAW(stdout, e.stdout_data());
    PRINT_RAW(stderr, e.stderr_data());
    PRINT(stderr, "apiref: error: {}\n", e.what());
    return EXIT_FAILURE;
  } catch (const core::ErrorBase& e) {
    PRINT(stderr, "apiref: error: {}\n", e.what());
    return EXIT_FAILURE;
  }
}
