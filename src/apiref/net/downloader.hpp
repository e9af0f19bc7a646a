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

#include <nonstd/span.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace net {

struct HttpResponseInfo
{
  int status = 0;
  uint64_t body_size = 0;
};

struct DownloadFailure
{
  enum class Kind {
    network,     // connection failure or I/O error on the socket
    timeout,     // connect or operation timeout
    http_status, // the server answered with a non-2xx status
    aborted,     // the body receiver asked to stop
  };

  Kind kind;
  std::string message;
};

// Called for each chunk of the response body. Return false to abort the
// transfer.
using BodyReceiver = std::function<bool(nonstd::span<const uint8_t> data)>;

// This class defines the API for retrieving remote resources.
class Downloader
{
public:
  virtual ~Downloader() = default;

  // Perform a GET request for `url` and pass the body of a successful (2xx)
  // response to `receiver`. The body of an unsuccessful response is discarded.
  virtual tl::expected<HttpResponseInfo, DownloadFailure>
  get(const std::string& url, const BodyReceiver& receiver) = 0;
};

} // namespace net
