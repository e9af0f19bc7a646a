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

#include <apiref/net/downloader.hpp>

#include <chrono>
#include <string>

namespace net {

// Downloader backed by cpp-httplib. Redirects are followed.
class HttpDownloader : public Downloader
{
public:
  HttpDownloader(std::chrono::milliseconds connect_timeout,
                 std::chrono::milliseconds operation_timeout);

  tl::expected<HttpResponseInfo, DownloadFailure>
  get(const std::string& url, const BodyReceiver& receiver) override;

private:
  std::chrono::milliseconds m_connect_timeout;
  std::chrono::milliseconds m_operation_timeout;
};

} // namespace net
