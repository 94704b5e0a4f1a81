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

#include "utils/calendar.hpp"

#include <array>

#include "utils/logging.hpp"

namespace edgeclient::utils {
namespace {

constexpr std::array<int, 13> kDaysInMonth{0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
constexpr std::array<int, 13> kDaysBeforeMonth{0, 0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};

constexpr int64_t kDaysInEra = 146097;  // 400 years
// Days from 0000-03-01 to 1970-01-01; eras start in March so the leap day
// is the last day of an era year.
constexpr int64_t kEraShift = 719468;

}  // namespace

int DaysInMonth(const int64_t year, const int64_t month) {
  DEC_ASSERT(1 <= month && month <= 12, "Invalid month {}", month);
  if (month == 2 && IsLeapYear(year)) {
    return 29;
  }
  return kDaysInMonth[month];
}

int64_t DaysBeforeYear(const int64_t year) {
  const auto y = year - 1;
  return y * 365 + FloorDiv(y, 4) - FloorDiv(y, 100) + FloorDiv(y, 400);
}

int DaysBeforeMonth(const int64_t year, const int64_t month) {
  DEC_ASSERT(1 <= month && month <= 12, "Invalid month {}", month);
  return kDaysBeforeMonth[month] + ((month > 2 && IsLeapYear(year)) ? 1 : 0);
}

int64_t YmdToOrdinal(const int64_t year, const int64_t month, const int64_t day) {
  DEC_ASSERT(1 <= day && day <= DaysInMonth(year, month), "Invalid day {} for {}-{}", day, year, month);
  return DaysBeforeYear(year) + DaysBeforeMonth(year, month) + day;
}

YearMonthDay OrdinalToYmd(const int64_t ordinal) {
  const auto shifted = ordinal - kUnixEpochOrdinal + kEraShift;
  const auto era = FloorDiv(shifted, kDaysInEra);
  const auto doe = shifted - era * kDaysInEra;                             // [0, 146096]
  const auto yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;  // [0, 399]
  const auto doy = doe - (365 * yoe + yoe / 4 - yoe / 100);                // [0, 365]
  const auto mp = (5 * doy + 2) / 153;                                     // [0, 11]

  YearMonthDay ymd;
  ymd.day = doy - (153 * mp + 2) / 5 + 1;
  ymd.month = mp < 10 ? mp + 3 : mp - 9;
  ymd.year = yoe + era * 400 + (ymd.month <= 2 ? 1 : 0);
  return ymd;
}

UtcDateTime SplitEpochMilliseconds(const int64_t milliseconds) {
  const auto days = FloorDiv(milliseconds, kMillisecondsPerDay);
  auto time_of_day = milliseconds - days * kMillisecondsPerDay;

  UtcDateTime result;
  result.date = OrdinalToYmd(days + kUnixEpochOrdinal);
  result.hour = time_of_day / kMillisecondsPerHour;
  time_of_day %= kMillisecondsPerHour;
  result.minute = time_of_day / kMillisecondsPerMinute;
  time_of_day %= kMillisecondsPerMinute;
  result.second = time_of_day / kMillisecondsPerSecond;
  result.millisecond = time_of_day % kMillisecondsPerSecond;
  // 1970-01-01 was a Thursday
  result.day_of_week = FloorMod(days + 4, 7);
  return result;
}

}  // namespace edgeclient::utils
