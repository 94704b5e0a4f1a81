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


#include "datatypes/local_date.hpp"

#include <functional>
#include <limits>

#include <fmt/format.h>

#include "datatypes/temporal_exceptions.hpp"
#include "utils/calendar.hpp"
#include "utils/iso8601.hpp"

namespace edgeclient::datatypes {

LocalDate::LocalDate(const int32_t year, const int32_t month, const int32_t day) {
  if (month < 0 || month > 11) {
    throw ValidationException("invalid month index {}: expected a value in 0-11 range", month);
  }

  const auto max_days = utils::DaysInMonth(year, month + 1);
  if (day < 1 || day > max_days) {
    throw ValidationException("invalid number of days {}: expected a value in 1-{} range", day, max_days);
  }

  year_ = year;
  month_ = month;
  day_ = day;
}

LocalDate LocalDate::FromOrdinal(const int64_t ordinal) {
  // first day of the smallest and last day of the largest int32 year
  const auto min_ordinal = utils::DaysBeforeYear(std::numeric_limits<int32_t>::min()) + 1;
  const auto max_ordinal = utils::DaysBeforeYear(static_cast<int64_t>(std::numeric_limits<int32_t>::max()) + 1);
  if (ordinal < min_ordinal || ordinal > max_ordinal) {
    throw ValidationException("ordinal {} is out of the supported date range", ordinal);
  }
  const auto ymd = utils::OrdinalToYmd(ordinal);
  return LocalDate(static_cast<int32_t>(ymd.year), static_cast<int32_t>(ymd.month - 1), static_cast<int32_t>(ymd.day));
}

LocalDate LocalDate::FromOrdinalUnchecked(utils::PassKey<protocol::TemporalDecoder> /*key*/, const int64_t ordinal) {
  const auto ymd = utils::OrdinalToYmd(ordinal);
  LocalDate date;
  date.year_ = static_cast<int32_t>(ymd.year);
  date.month_ = static_cast<int32_t>(ymd.month - 1);
  date.day_ = static_cast<int32_t>(ymd.day);
  return date;
}

int64_t LocalDate::ToOrdinal() const { return utils::YmdToOrdinal(year_, month_ + 1, day_); }

int64_t LocalDate::DaysSinceEpoch() const { return ToOrdinal() - utils::kUnixEpochOrdinal; }

std::string LocalDate::ToString() const { return utils::FormatIsoDate(year_, month_ + 1, day_); }

std::string LocalDate::ToDebugString() const { return fmt::format("LocalDate [ {} ]", ToString()); }

size_t LocalDateHash::operator()(const LocalDate &date) const { return std::hash<int64_t>{}(date.ToOrdinal()); }

}  // namespace edgeclient::datatypes
