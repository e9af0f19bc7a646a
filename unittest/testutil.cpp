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

#include "testutil.hpp"

#include <apiref/core/exceptions.hpp>
#include <apiref/util/expected.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>

#include <algorithm>
#include <tuple>

namespace fs = util::filesystem;

namespace TestUtil {

size_t TestContext::m_subdir_counter = 0;

TestContext::TestContext()
  : m_test_dir(util::value_or_throw<core::Error>(
      fs::current_path(), "Failed to retrieve current directory"))
{
  if (m_test_dir.parent_path().filename() != "testdir") {
    throw core::Error("TestContext instantiated outside test directory");
  }
  ++m_subdir_counter;
  fs::path subtest_dir = m_test_dir / FMT("test_{}", m_subdir_counter);
  util::throw_on_error<core::Error>(fs::create_directories(subtest_dir),
                                    FMT("Failed to create {}: ", subtest_dir));
  util::throw_on_error<core::Error>(
    fs::current_path(subtest_dir),
    FMT("Failed to change directory to {}", subtest_dir));
}

TestContext::~TestContext()
{
  std::ignore = fs::current_path(m_test_dir);
}

void
FakeDownloader::add(const std::string& url, const std::string& body)
{
  m_responses[url] = Response{200, body, std::nullopt};
}

void
FakeDownloader::add_status(const std::string& url, int status)
{
  m_responses[url] = Response{status, "error page", std::nullopt};
}

void
FakeDownloader::add_truncated(const std::string& url,
                              const std::string& body,
                              size_t delivered_bytes)
{
  m_responses[url] = Response{200, body, delivered_bytes};
}

size_t
FakeDownloader::request_count(const std::string& url) const
{
  const auto it = m_request_counts.find(url);
  return it == m_request_counts.end() ? 0 : it->second;
}

tl::expected<net::HttpResponseInfo, net::DownloadFailure>
FakeDownloader::get(const std::string& url, const net::BodyReceiver& receiver)
{
  ++m_request_counts[url];

  const auto it = m_responses.find(url);
  if (it == m_responses.end()) {
    return tl::unexpected(net::DownloadFailure{
      net::DownloadFailure::Kind::network,
      FMT("Failed to download {}: Could not establish connection", url)});
  }

  const auto& response = it->second;
  if (response.status < 200 || response.status >= 300) {
    return tl::unexpected(net::DownloadFailure{
      net::DownloadFailure::Kind::http_status,
      FMT("{} returned HTTP status {}", url, response.status)});
  }

  const auto size = response.fail_after
                      ? std::min(*response.fail_after, response.body.size())
                      : response.body.size();
  // Deliver in small chunks to exercise incremental writing.
  const size_t chunk_size = 3;
  for (size_t pos = 0; pos < size; pos += chunk_size) {
    const auto length = std::min(chunk_size, size - pos);
    const bool keep_going = receiver(nonstd::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(response.body.data() + pos), length));
    if (!keep_going) {
      return tl::unexpected(net::DownloadFailure{
        net::DownloadFailure::Kind::aborted, "Download canceled"});
    }
  }

  if (response.fail_after) {
    return tl::unexpected(net::DownloadFailure{
      net::DownloadFailure::Kind::network,
      FMT("Failed to download {}: Connection reset", url)});
  }
  return net::HttpResponseInfo{response.status, size};
}

tl::expected<void, core::InstallFailure>
FakeInstaller::install(const core::PackageMap& packages)
{
  calls.push_back(packages);
  if (failure) {
    return tl::unexpected(*failure);
  }
  if (project_file) {
    auto text =
      util::value_or_throw<core::Error>(util::read_file(*project_file));
    for (const auto& [id, version] : packages) {
      text += FMT("PackageReference = {}\n  Version = {}\n", id, version);
    }
    util::throw_on_error<core::Error>(util::write_file(*project_file, text));
  }
  return {};
}

std::string
read_stream(FILE* stream)
{
  std::string result;
  fflush(stream);
  rewind(stream);
  char buffer[1024];
  size_t n;
  while ((n = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
    result.append(buffer, n);
  }
  return result;
}

} // namespace TestUtil
