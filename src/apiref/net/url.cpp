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

#include "url.hpp"

#include <apiref/util/format.hpp>
#include <apiref/util/string.hpp>

#include <exception>
#include <tuple>

namespace net {

namespace {

const char k_redacted_user_info[] = "********";

} // namespace

tl::expected<Url, std::string>
parse_url(const std::string& url_string)
{
  Url url(url_string);
  try {
    std::ignore = url.str();
  } catch (const std::exception& e) {
    return tl::unexpected(FMT("Cannot parse URL {}: {}", url_string, e.what()));
  }
  if (url.scheme().empty()) {
    return tl::unexpected(FMT("URL scheme must not be empty: {}", url_string));
  }
  return url;
}

bool
is_remote_url(const std::string& string)
{
  const auto url = parse_url(string);
  if (!url) {
    return false;
  }
  const auto scheme = util::to_lowercase(url->scheme());
  return (scheme == "http" || scheme == "https") && !url->host().empty();
}

std::string
redacted_url_for_logging(const Url& url)
{
  Url redacted_url(url);
  if (!url.user_info().empty()) {
    redacted_url.user_info(k_redacted_user_info);
  }
  return redacted_url.str();
}

std::string
request_target(const std::string& url_string)
{
  auto target = std::string_view(url_string);
  const auto scheme_end = target.find("://");
  if (scheme_end != std::string_view::npos) {
    target = target.substr(scheme_end + 3);
  }
  const auto authority_end = target.find_first_of("/?#");
  if (authority_end == std::string_view::npos) {
    return "/";
  }
  target = target.substr(authority_end);
  target = target.substr(0, target.find('#'));
  if (target.empty()) {
    return "/";
  }
  return target[0] == '/' ? std::string(target) : FMT("/{}", target);
}

} // namespace net
