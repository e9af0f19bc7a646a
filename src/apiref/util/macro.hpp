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

#define APIREF_STRINGIFY_(x_) #x_
#define APIREF_STRINGIFY(x_) APIREF_STRINGIFY_(x_)

#define APIREF_CONCAT_(a_, b_) a_##b_
#define APIREF_CONCAT(a_, b_) APIREF_CONCAT_(a_, b_)

// Create a variable name that is unique within the current translation unit.
#define UNIQUE_VARNAME(prefix_) APIREF_CONCAT(prefix_, __LINE__)
