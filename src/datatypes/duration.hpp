// Copyright 2025 The edgeclient Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with
// the License. You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on
// an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the
// specific language governing permissions and limitations under the License.


#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include <fmt/ostream.h>

namespace edgeclient::datatypes {

/**
 * @brief Calendar-aware interval.
 *
 * Months, days and milliseconds are independent components with independent
 * signs. They are never normalized against each other because a month has no
 * fixed number of days and, across a daylight saving change, a day has no
 * fixed number of milliseconds.
 */
class Duration {
 public:
  explicit Duration(int32_t months = 0, int32_t days = 0, int64_t milliseconds = 0)
      : months_(months), days_(days), milliseconds_(milliseconds) {}

  int32_t Months() const { return months_; }
  int32_t Days() const { return days_; }
  int64_t Milliseconds() const { return milliseconds_; }

  /**
   * Verbose interval format, e.g. `1 year 2 months -3 days +04:05:06.5`.
   *
   * Nonzero calendar units come first, a positive unit that follows a
   * negative one is marked with '+'. The clock part is written when there is
   * no calendar unit or when any clock component is nonzero.
   *
   * @throw FormatInvariantException if splitting the milliseconds yields an
   *        hour count whose sign differs from the input.
   */
  std::string ToString() const;
  std::string ToDebugString() const;

  bool operator==(const Duration &) const = default;

  friend std::ostream &operator<<(std::ostream &os, const Duration &dur) { return os << dur.ToDebugString(); }

 private:
  int32_t months_;
  int32_t days_;
  int64_t milliseconds_;
};

struct DurationHash {
  size_t operator()(const Duration &duration) const;
};

}  // namespace edgeclient::datatypes

template <>
class fmt::formatter<edgeclient::datatypes::Duration> : public fmt::ostream_formatter {};
