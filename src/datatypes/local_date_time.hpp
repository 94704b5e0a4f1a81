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

#include "datatypes/local_date.hpp"
#include "datatypes/local_time.hpp"
#include "utils/calendar.hpp"
#include "utils/pass_key.hpp"

namespace edgeclient::protocol {
class TemporalDecoder;
}  // namespace edgeclient::protocol

namespace edgeclient::datatypes {

// Every LocalDateTime lies within this many days of 1970-01-01T00:00:00.
inline constexpr int64_t kMaxDaysFromEpoch = 100'000'000;
inline constexpr int64_t kMaxMillisecondsFromEpoch = kMaxDaysFromEpoch * utils::kMillisecondsPerDay;

/**
 * @brief A date and a time of day without a time zone.
 *
 * The value is kept as milliseconds since 1970-01-01T00:00:00 read as UTC.
 * That instant is only a storage format: the fields are a reading of a wall
 * clock and the host time zone is never consulted, neither when the value is
 * built nor when its fields are read back.
 */
class LocalDateTime {
 public:
  /**
   * Combines the fields the way UTC calendar arithmetic does: a field outside
   * its natural range carries into the next larger unit, so month 12 is
   * January of the following year and day 0 is the last day of the previous
   * month.
   *
   * @throw ValidationException if the combined instant is more than
   *        8.64e15 milliseconds away from the epoch.
   */
  explicit LocalDateTime(int32_t year, int32_t month = 0, int32_t day = 1, int32_t hour = 0, int32_t minute = 0,
                         int32_t second = 0, int32_t millisecond = 0);

  LocalDateTime(const LocalDate &date, const LocalTime &time);

  /// The caller guarantees |milliseconds| <= kMaxMillisecondsFromEpoch.
  static LocalDateTime FromMillisecondsSinceEpoch(utils::PassKey<protocol::TemporalDecoder> key,
                                                  int64_t milliseconds);

  int32_t Year() const;
  // zero-based
  int32_t Month() const;
  int32_t Day() const;
  int32_t Hour() const;
  int32_t Minute() const;
  int32_t Second() const;
  int32_t Millisecond() const;
  // 0 is Sunday
  int32_t DayOfWeek() const;

  int64_t MillisecondsSinceEpoch() const { return milliseconds_; }

  LocalDate Date() const;
  LocalTime Time() const;

  // YYYY-MM-DDTHH:MM:SS[.fraction]
  std::string ToString() const;
  // YYYY-MM-DD HH:MM:SS[.fraction]
  std::string ToPlainString() const;
  std::string ToDebugString() const;

  auto operator<=>(const LocalDateTime &) const = default;

  friend std::ostream &operator<<(std::ostream &os, const LocalDateTime &ldt) { return os << ldt.ToDebugString(); }

 private:
  LocalDateTime() = default;

  int64_t milliseconds_{0};
};

struct LocalDateTimeHash {
  size_t operator()(const LocalDateTime &local_date_time) const;
};

}  // namespace edgeclient::datatypes

template <>
class fmt::formatter<edgeclient::datatypes::LocalDateTime> : public fmt::ostream_formatter {};
