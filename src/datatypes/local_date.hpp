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
 * @brief A calendar date without a time zone.
 *
 * The month is zero-based (0 is January) and the day is one-based. The year
 * follows the proleptic Gregorian calendar and may be zero or negative.
 */
class LocalDate {
 public:
  /// @throw ValidationException if the month is outside 0-11 or the day does
  ///        not exist in that month of that year.
  explicit LocalDate(int32_t year, int32_t month = 0, int32_t day = 1);

  /// Builds the date with the given ordinal day number (0001-01-01 is 1).
  /// Adding to or subtracting from an ordinal moves the date by whole days.
  static LocalDate FromOrdinal(int64_t ordinal);

  /// Wire values are valid by construction, so the decoder skips validation.
  static LocalDate FromOrdinalUnchecked(utils::PassKey<protocol::TemporalDecoder> key, int64_t ordinal);

  int32_t Year() const { return year_; }
  int32_t Month() const { return month_; }
  int32_t Day() const { return day_; }

  int64_t ToOrdinal() const;
  int64_t DaysSinceEpoch() const;

  // YYYY-MM-DD
  std::string ToString() const;
  std::string ToDebugString() const;

  auto operator<=>(const LocalDate &) const = default;

  friend std::ostream &operator<<(std::ostream &os, const LocalDate &date) { return os << date.ToDebugString(); }

 private:
  LocalDate() = default;

  int32_t year_{1};
  int32_t month_{0};
  int32_t day_{1};
};

struct LocalDateHash {
  size_t operator()(const LocalDate &date) const;
};

}  // namespace edgeclient::datatypes

template <>
class fmt::formatter<edgeclient::datatypes::LocalDate> : public fmt::ostream_formatter {};
