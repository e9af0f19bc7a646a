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

#include "contentfetcher.hpp"

#include <apiref/core/exceptions.hpp>
#include <apiref/hash.hpp>
#include <apiref/net/downloader.hpp>
#include <apiref/util/fd.hpp>
#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>
#include <apiref/util/logging.hpp>
#include <apiref/util/path.hpp>
#include <apiref/util/string.hpp>

#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <tuple>

namespace fs = util::filesystem;

namespace core {

namespace {

DownloadError::Reason
reason_from_failure(const net::DownloadFailure& failure)
{
  return failure.kind == net::DownloadFailure::Kind::http_status
           ? DownloadError::Reason::http_status
           : DownloadError::Reason::network;
}

} // namespace

ContentFetcher::ContentFetcher(net::Downloader& downloader,
                               std::filesystem::path base_dir)
  : m_downloader(downloader),
    m_base_dir(std::move(base_dir))
{
}

DownloadOutcome
ContentFetcher::fetch(const std::string& source_url,
                      const fs::path& destination,
                      Overwrite overwrite)
{
  const auto path = util::make_absolute(destination, m_base_dir);
  if (overwrite == Overwrite::no && fs::exists(path)) {
    return compare_with_existing(source_url, path);
  }
  return write_to_file(source_url, path);
}

DownloadOutcome
ContentFetcher::compare_with_existing(const std::string& source_url,
                                      const fs::path& path)
{
  Hash downloaded_hash;
  const auto response = m_downloader.get(
    source_url, [&](nonstd::span<const uint8_t> data) {
      downloaded_hash.hash(data);
      return true;
    });
  if (!response) {
    throw DownloadError(reason_from_failure(response.error()),
                        response.error().message);
  }

  Hash existing_hash;
  const auto hashed = existing_hash.hash_file(path);
  if (!hashed) {
    throw DownloadError(DownloadError::Reason::io,
                        FMT("Failed to read {}: {}", path, hashed.error()));
  }

  const auto downloaded_digest = downloaded_hash.digest();
  const auto existing_digest = existing_hash.digest();
  LOG("Content digest of {}: {}, of {}: {}",
      source_url,
      util::format_base16(downloaded_digest),
      path,
      util::format_base16(existing_digest));

  if (downloaded_digest != existing_digest) {
    throw DownloadError(
      DownloadError::Reason::conflict,
      FMT("File '{}' already exists with different content. Aborting to avoid"
          " conflicts.",
          path));
  }
  return {DownloadOutcome::Result::unchanged, path};
}

DownloadOutcome
ContentFetcher::write_to_file(const std::string& source_url,
                              const fs::path& path)
{
  // The destination is opened when the first byte arrives so that a failed
  // connection leaves an existing file alone.
  util::Fd fd;
  bool opened = false;
  std::optional<std::string> write_error;

  const auto open_destination = [&]() -> bool {
    if (fd) {
      return true;
    }
    const auto parent = path.parent_path();
    if (!parent.empty() && !fs::is_directory(parent)) {
      if (auto created = fs::create_directories(parent); !created) {
        write_error =
          FMT("Failed to create directory {}: {}", parent, created.error());
        return false;
      }
    }
    fd = util::Fd(
      open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666));
    if (!fd) {
      write_error =
        FMT("Failed to open {} for writing: {}", path, strerror(errno));
      return false;
    }
    opened = true;
    return true;
  };

  const auto response = m_downloader.get(
    source_url, [&](nonstd::span<const uint8_t> data) {
      if (!open_destination()) {
        return false;
      }
      const auto written = util::write_fd(*fd, data.data(), data.size());
      if (!written) {
        write_error = FMT("Failed to write to {}: {}", path, written.error());
        return false;
      }
      return true;
    });

  // An empty body still produces an (empty) destination file.
  if (response && !write_error) {
    std::ignore = open_destination();
  }

  if (fd && !write_error && !fd.close()) {
    write_error = FMT("Failed to close {}: {}", path, strerror(errno));
  }

  if (!response || write_error) {
    fd.close();
    if (opened) {
      std::ignore = util::remove(path);
    }
    if (write_error) {
      throw DownloadError(DownloadError::Reason::io, *write_error);
    }
    throw DownloadError(reason_from_failure(response.error()),
                        response.error().message);
  }

  LOG("Wrote {} bytes from {} to {}", response->body_size, source_url, path);
  return {DownloadOutcome::Result::written, path};
}

} // namespace core
