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

#include <apiref/core/dependencyinstaller.hpp>
#include <apiref/net/downloader.hpp>

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace TestUtil {

// This class is intended to be instantiated in all test cases that create local
// files.
class TestContext
{
public:
  TestContext();
  ~TestContext();

  TestContext(const TestContext&) = delete;
  TestContext& operator=(const TestContext&) = delete;

private:
  std::filesystem::path m_test_dir;
  static size_t m_subdir_counter;
};

// Downloader serving canned responses. Unknown URLs fail like an unreachable
// host.
class FakeDownloader : public net::Downloader
{
public:
  void add(const std::string& url, const std::string& body);
  void add_status(const std::string& url, int status);

  // Deliver the first `delivered_bytes` bytes of `body` and then fail like a
  // dropped connection.
  void add_truncated(const std::string& url,
                     const std::string& body,
                     size_t delivered_bytes);

  size_t request_count(const std::string& url) const;

  tl::expected<net::HttpResponseInfo, net::DownloadFailure>
  get(const std::string& url, const net::BodyReceiver& receiver) override;

private:
  struct Response
  {
    int status = 200;
    std::string body;
    std::optional<size_t> fail_after;
  };

  std::map<std::string, Response> m_responses;
  std::map<std::string, size_t> m_request_counts;
};

// Installer recording the requested packages instead of running anything.
class FakeInstaller : public core::DependencyInstaller
{
public:
  std::vector<core::PackageMap> calls;
  std::optional<core::InstallFailure> failure;
  // If set, a PackageReference item per package is appended to this file.
  std::optional<std::filesystem::path> project_file;

  tl::expected<void, core::InstallFailure>
  install(const core::PackageMap& packages) override;
};

// Return everything written to `stream` so far.
std::string read_stream(FILE* stream);

} // namespace TestUtil
