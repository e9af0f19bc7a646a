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

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace util {

// --- Interface ---

using TimePoint =
  std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

// Format `time` as a human-readable ISO8601 timestamp string in local time.
std::string format_iso8601_timestamp(const TimePoint& time);

// Thread-safe version of `localtime(3)`. If `time` is not specified the current
// time of day is used.
std::optional<tm> localtime(std::optional<TimePoint> time = {});

TimePoint now();

int32_t nsec_part(TimePoint tp);

int64_t sec(TimePoint tp);

// --- Inline implementations ---

inline TimePoint
now()
{
  return std::chrono::system_clock::now();
}

inline int32_t
nsec_part(TimePoint tp)
{
  return static_cast<int32_t>(
    std::chrono::duration_cast<std::chrono::nanoseconds>(
      tp.time_since_epoch() % std::chrono::seconds(1))
      .count());
}

inline int64_t
sec(TimePoint tp)
{
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
    .count();
}

} // namespace util
