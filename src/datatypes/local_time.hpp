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

#include <compare>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include <fmt/ostream.h>

#include "utils/pass_key.hpp"

namespace edgeclient::protocol {
class TemporalDecoder;
}  // namespace edgeclient::protocol

namespace edgeclient::datatypes {

/**
 * @brief Wall-clock time of day with millisecond precision.
 *
 * LocalTime is independent of any date, so it never wraps past midnight and
 * its fields never carry into each other.
 */
class LocalTime {
 public:
  /// @throw ValidationException naming the first field outside its range.
  explicit LocalTime(int32_t hours, int32_t minutes = 0, int32_t seconds = 0, int32_t milliseconds = 0);

  static LocalTime FromFieldsUnchecked(utils::PassKey<protocol::TemporalDecoder> key, int32_t hours, int32_t minutes,
                                       int32_t seconds, int32_t milliseconds);

  int32_t Hours() const { return hours_; }
  int32_t Minutes() const { return minutes_; }
  int32_t Seconds() const { return seconds_; }
  int32_t Milliseconds() const { return milliseconds_; }

  int64_t MillisecondsSinceMidnight() const;

  // HH:MM:SS[.fraction]
  std::string ToString() const;
  std::string ToDebugString() const;

  auto operator<=>(const LocalTime &) const = default;

  friend std::ostream &operator<<(std::ostream &os, const LocalTime &time) { return os << time.ToDebugString(); }

 private:
  LocalTime() = default;

  int32_t hours_{0};
  int32_t minutes_{0};
  int32_t seconds_{0};
  int32_t milliseconds_{0};
};

struct LocalTimeHash {
  size_t operator()(const LocalTime &local_time) const;
};

}  // namespace edgeclient::datatypes

template <>
class fmt::formatter<edgeclient::datatypes::LocalTime> : public fmt::ostream_formatter {};
