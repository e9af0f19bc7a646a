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

#include "httpdownloader.hpp"

#include <apiref/net/url.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>
#include <apiref/util/string.hpp>

#include <httplib.h>

namespace net {

namespace {

Url
get_partial_url(const Url& from_url)
{
  Url url;
  url.scheme(from_url.scheme());
  url.host(from_url.host(), from_url.ip_version());
  if (!from_url.port().empty()) {
    url.port(from_url.port());
  }
  return url;
}

DownloadFailure::Kind
failure_kind_from_httplib_error(httplib::Error error)
{
  switch (error) {
  case httplib::Error::ConnectionTimeout:
  case httplib::Error::Read:
    return DownloadFailure::Kind::timeout;
  case httplib::Error::Canceled:
    return DownloadFailure::Kind::aborted;
  default:
    return DownloadFailure::Kind::network;
  }
}

} // namespace

HttpDownloader::HttpDownloader(std::chrono::milliseconds connect_timeout,
                               std::chrono::milliseconds operation_timeout)
  : m_connect_timeout(connect_timeout),
    m_operation_timeout(operation_timeout)
{
}

tl::expected<HttpResponseInfo, DownloadFailure>
HttpDownloader::get(const std::string& url_string, const BodyReceiver& receiver)
{
  const auto url = parse_url(url_string);
  if (!url) {
    return tl::unexpected(
      DownloadFailure{DownloadFailure::Kind::network, url.error()});
  }
  const auto redacted_url = redacted_url_for_logging(*url);

  // httplib requires a partial URL with just scheme, host and port.
  httplib::Client client(get_partial_url(*url).str());
  if (!url->user_info().empty()) {
    const auto [user, password] =
      util::split_once_into_views(url->user_info(), ':');
    client.set_basic_auth(std::string(user),
                          password ? std::string(*password) : std::string());
  }
  client.set_follow_location(true);
  client.set_connection_timeout(m_connect_timeout);
  client.set_read_timeout(m_operation_timeout);
  client.set_write_timeout(m_operation_timeout);
  client.set_default_headers(
    {{"User-Agent", FMT("apiref/{}", APIREF_VERSION)}});

  HttpResponseInfo info;
  const auto result = client.Get(
    request_target(url_string),
    [&](const httplib::Response& response) {
      info.status = response.status;
      // Stop before reading the body of an unsuccessful response.
      return response.status >= 200 && response.status < 300;
    },
    [&](const char* data, size_t length) {
      info.body_size += length;
      return receiver(nonstd::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data), length));
    });

  if (info.status != 0 && (info.status < 200 || info.status >= 300)) {
    LOG("GET {} -> {}", redacted_url, info.status);
    return tl::unexpected(
      DownloadFailure{DownloadFailure::Kind::http_status,
                      FMT("{} returned HTTP status {}", url_string, info.status)});
  }

  if (!result || result.error() != httplib::Error::Success) {
    LOG("Failed to get {}: {} ({})",
        redacted_url,
        to_string(result.error()),
        static_cast<int>(result.error()));
    return tl::unexpected(
      DownloadFailure{failure_kind_from_httplib_error(result.error()),
                      FMT("Failed to download {}: {}",
                          redacted_url,
                          to_string(result.error()))});
  }

  LOG("GET {} -> {} ({} bytes)", redacted_url, info.status, info.body_size);
  return info;
}

} // namespace net
