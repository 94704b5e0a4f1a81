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


#include "datatypes/local_date_time.hpp"

#include <functional>
#include <optional>

#include <fmt/format.h>

#include "datatypes/temporal_exceptions.hpp"
#include "utils/calendar.hpp"
#include "utils/iso8601.hpp"
#include "utils/logging.hpp"

namespace edgeclient::datatypes {
namespace {

// The time part of the field constructor can shift the result by less than
// kMaxDaysFromEpoch days, so a day count beyond twice the limit can never
// come back into range and is rejected before it can overflow.
std::optional<int64_t> CombineInstant(const int64_t days, const int64_t time_milliseconds) {
  if (days < -2 * kMaxDaysFromEpoch || days > 2 * kMaxDaysFromEpoch) {
    return std::nullopt;
  }
  const auto milliseconds = days * utils::kMillisecondsPerDay + time_milliseconds;
  if (milliseconds < -kMaxMillisecondsFromEpoch || milliseconds > kMaxMillisecondsFromEpoch) {
    return std::nullopt;
  }
  return milliseconds;
}

}  // namespace

LocalDateTime::LocalDateTime(const int32_t year, const int32_t month, const int32_t day, const int32_t hour,
                             const int32_t minute, const int32_t second, const int32_t millisecond) {
  const auto normalized_year = static_cast<int64_t>(year) + utils::FloorDiv(month, 12);
  const auto normalized_month = utils::FloorMod(month, 12) + 1;
  const auto days = utils::YmdToOrdinal(normalized_year, normalized_month, 1) - utils::kUnixEpochOrdinal +
                    (static_cast<int64_t>(day) - 1);
  const auto time_milliseconds = hour * utils::kMillisecondsPerHour + minute * utils::kMillisecondsPerMinute +
                                 second * utils::kMillisecondsPerSecond + millisecond;

  const auto milliseconds = CombineInstant(days, time_milliseconds);
  if (!milliseconds) {
    throw ValidationException(
        "invalid LocalDateTime {}-{}-{} {}:{}:{}.{}: the value is out of the supported range of +-{} days from the "
        "epoch",
        year, month, day, hour, minute, second, millisecond, kMaxDaysFromEpoch);
  }
  milliseconds_ = *milliseconds;
}

LocalDateTime::LocalDateTime(const LocalDate &date, const LocalTime &time) {
  const auto milliseconds = CombineInstant(date.DaysSinceEpoch(), time.MillisecondsSinceMidnight());
  if (!milliseconds) {
    throw ValidationException("invalid LocalDateTime {}T{}: the value is out of the supported range of +-{} days from "
                              "the epoch",
                              date.ToString(), time.ToString(), kMaxDaysFromEpoch);
  }
  milliseconds_ = *milliseconds;
}

LocalDateTime LocalDateTime::FromMillisecondsSinceEpoch(utils::PassKey<protocol::TemporalDecoder> /*key*/,
                                                        const int64_t milliseconds) {
  DEC_ASSERT(-kMaxMillisecondsFromEpoch <= milliseconds && milliseconds <= kMaxMillisecondsFromEpoch,
             "Decoded LocalDateTime {} is out of range", milliseconds);
  LocalDateTime local_date_time;
  local_date_time.milliseconds_ = milliseconds;
  return local_date_time;
}

int32_t LocalDateTime::Year() const {
  return static_cast<int32_t>(utils::SplitEpochMilliseconds(milliseconds_).date.year);
}

int32_t LocalDateTime::Month() const {
  return static_cast<int32_t>(utils::SplitEpochMilliseconds(milliseconds_).date.month - 1);
}

int32_t LocalDateTime::Day() const {
  return static_cast<int32_t>(utils::SplitEpochMilliseconds(milliseconds_).date.day);
}

int32_t LocalDateTime::Hour() const { return static_cast<int32_t>(utils::SplitEpochMilliseconds(milliseconds_).hour); }

int32_t LocalDateTime::Minute() const {
  return static_cast<int32_t>(utils::SplitEpochMilliseconds(milliseconds_).minute);
}

int32_t LocalDateTime::Second() const {
  return static_cast<int32_t>(utils::SplitEpochMilliseconds(milliseconds_).second);
}

int32_t LocalDateTime::Millisecond() const {
  return static_cast<int32_t>(utils::FloorMod(milliseconds_, utils::kMillisecondsPerSecond));
}

int32_t LocalDateTime::DayOfWeek() const {
  return static_cast<int32_t>(utils::SplitEpochMilliseconds(milliseconds_).day_of_week);
}

LocalDate LocalDateTime::Date() const {
  const auto fields = utils::SplitEpochMilliseconds(milliseconds_);
  return LocalDate(static_cast<int32_t>(fields.date.year), static_cast<int32_t>(fields.date.month - 1),
                   static_cast<int32_t>(fields.date.day));
}

LocalTime LocalDateTime::Time() const {
  const auto fields = utils::SplitEpochMilliseconds(milliseconds_);
  return LocalTime(static_cast<int32_t>(fields.hour), static_cast<int32_t>(fields.minute),
                   static_cast<int32_t>(fields.second), static_cast<int32_t>(fields.millisecond));
}

std::string LocalDateTime::ToString() const {
  // The generic formatter describes a UTC instant; this value has no zone, so
  // the designator goes and the milliseconds follow the LocalTime rules.
  auto result = utils::FormatUtcTimestamp(milliseconds_);
  EC_ASSERT(result.ends_with('Z'), "Unexpected ISO 8601 timestamp format: {}", result);
  result.pop_back();

  static constexpr size_t kFractionSize = 4;  // ".mmm"
  EC_ASSERT(result.size() > kFractionSize && result[result.size() - kFractionSize] == '.',
            "Unexpected ISO 8601 fraction format: {}", result);
  result.resize(result.size() - kFractionSize);
  result += utils::FormatFraction(Millisecond(), 3);
  return result;
}

std::string LocalDateTime::ToPlainString() const {
  auto result = ToString();
  const auto separator = result.find('T');
  EC_ASSERT(separator != std::string::npos, "Missing date and time separator in {}", result);
  result[separator] = ' ';
  return result;
}

std::string LocalDateTime::ToDebugString() const { return fmt::format("LocalDateTime [ {} ]", ToString()); }

size_t LocalDateTimeHash::operator()(const LocalDateTime &local_date_time) const {
  return std::hash<int64_t>{}(local_date_time.MillisecondsSinceEpoch());
}

}  // namespace edgeclient::datatypes
