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

#include <filesystem>
#include <string>

namespace net {
class Downloader;
}

namespace core {

enum class Overwrite { no, yes };

struct DownloadOutcome
{
  enum class Result { written, unchanged };

  Result result;
  std::filesystem::path path; // absolute destination path
};

// Downloads remote content to a local file without clobbering a local copy
// whose content differs, unless asked to.
class ContentFetcher
{
public:
  // Relative destinations are resolved against `base_dir`.
  ContentFetcher(net::Downloader& downloader, std::filesystem::path base_dir);

  // Download `source_url` to `destination`. If the destination exists and
  // `overwrite` is Overwrite::no, the file is left untouched if its content is
  // identical to the downloaded content and core::DownloadError (reason
  // conflict) is thrown otherwise. Any other failure also throws
  // core::DownloadError, after removing a partially written destination file.
  DownloadOutcome fetch(const std::string& source_url,
                        const std::filesystem::path& destination,
                        Overwrite overwrite);

private:
  net::Downloader& m_downloader;
  std::filesystem::path m_base_dir;

  DownloadOutcome compare_with_existing(const std::string& source_url,
                                        const std::filesystem::path& path);
  DownloadOutcome write_to_file(const std::string& source_url,
                                const std::filesystem::path& path);
};

} // namespace core
