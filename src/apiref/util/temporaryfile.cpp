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

#include "temporaryfile.hpp"

#include <apiref/util/file.hpp>
#include <apiref/util/filesystem.hpp>
#include <apiref/util/format.hpp>

#include <sys/stat.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace fs = util::filesystem;

namespace util {

TemporaryFile::TemporaryFile(Fd&& fd_, const fs::path& path_)
  : fd(std::move(fd_)),
    path(path_)
{
}

tl::expected<TemporaryFile, std::string>
TemporaryFile::create(const fs::path& path_prefix, std::string_view suffix)
{
  if (path_prefix.has_parent_path()) {
    if (auto ret = fs::create_directories(path_prefix.parent_path()); !ret) {
      return tl::unexpected(ret.error().message());
    }
  }
  std::string path_template =
    FMT("{}{}XXXXXX{}", path_prefix, TemporaryFile::tmp_file_infix, suffix);
  Fd fd(mkstemps(path_template.data(), static_cast<int>(suffix.length())));
  if (!fd) {
    return tl::unexpected(FMT("failed to create temporary file for {}: {}",
                              path_template,
                              strerror(errno)));
  }

  util::set_cloexec_flag(*fd);

  const mode_t mask = umask(0);
  umask(mask);
  fchmod(*fd, 0666 & ~mask);

  return TemporaryFile(std::move(fd), path_template);
}

} // namespace util
