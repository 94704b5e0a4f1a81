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

#include <cstdint>

namespace edgeclient::utils {

// Proleptic Gregorian calendar arithmetic. Months are 1-based in this header.
// Nothing here consults the host timezone or the C library calendar functions.

struct YearMonthDay {
  int64_t year{1};
  int64_t month{1};
  int64_t day{1};

  bool operator==(const YearMonthDay &) const = default;
};

constexpr int64_t FloorDiv(const int64_t lhs, const int64_t rhs) {
  const auto quotient = lhs / rhs;
  return (lhs % rhs != 0 && ((lhs < 0) != (rhs < 0))) ? quotient - 1 : quotient;
}

constexpr int64_t FloorMod(const int64_t lhs, const int64_t rhs) { return lhs - FloorDiv(lhs, rhs) * rhs; }

constexpr bool IsLeapYear(const int64_t year) { return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0); }

int DaysInMonth(int64_t year, int64_t month);

// Number of days in the years before `year`, counted from 0001-01-01.
int64_t DaysBeforeYear(int64_t year);

// Number of days in the months of `year` that precede `month`.
int DaysBeforeMonth(int64_t year, int64_t month);

/**
 * Maps a valid calendar date to its ordinal day number. 0001-01-01 is
 * ordinal 1 and every following day adds one, so ordinals can be compared and
 * subtracted directly. Years before 1 continue the sequence downwards.
 */
int64_t YmdToOrdinal(int64_t year, int64_t month, int64_t day);

/// Exact inverse of @c YmdToOrdinal.
YearMonthDay OrdinalToYmd(int64_t ordinal);

inline constexpr int64_t kUnixEpochOrdinal = 719163;    // 1970-01-01
inline constexpr int64_t kServerEpochOrdinal = 730120;  // 2000-01-01

inline constexpr int64_t kMillisecondsPerSecond = 1'000;
inline constexpr int64_t kMillisecondsPerMinute = 60 * kMillisecondsPerSecond;
inline constexpr int64_t kMillisecondsPerHour = 60 * kMillisecondsPerMinute;
inline constexpr int64_t kMillisecondsPerDay = 24 * kMillisecondsPerHour;

// Wall-clock fields of a millisecond instant read as UTC.
struct UtcDateTime {
  YearMonthDay date;
  int64_t hour{0};
  int64_t minute{0};
  int64_t second{0};
  int64_t millisecond{0};
  int64_t day_of_week{0};  // 0 is Sunday
};

UtcDateTime SplitEpochMilliseconds(int64_t milliseconds);

}  // namespace edgeclient::utils
