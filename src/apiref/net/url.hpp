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

#include <cxxurl/url.hpp>
#include <tl/expected.hpp>

#include <string>

namespace net {

// Parse `url_string` eagerly. Url parses lazily, so this is the place where
// malformed URLs are detected.
tl::expected<Url, std::string> parse_url(const std::string& url_string);

// Return true if `string` is an absolute URL with scheme http or https and a
// non-empty host.
bool is_remote_url(const std::string& string);

// Return `url` with any user info replaced so that it can be logged.
std::string redacted_url_for_logging(const Url& url);

// Return the origin-form request target ("/path?query") of `url_string`, which
// must be a valid remote URL.
std::string request_target(const std::string& url_string);

} // namespace net
