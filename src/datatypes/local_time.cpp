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


#include "datatypes/local_time.hpp"

#include <functional>

#include <fmt/format.h>

#include "datatypes/temporal_exceptions.hpp"
#include "utils/calendar.hpp"
#include "utils/iso8601.hpp"
#include "utils/logging.hpp"

namespace edgeclient::datatypes {
namespace {

constexpr bool IsInBounds(const auto low, const auto high, const auto value) { return low <= value && value <= high; }

}  // namespace

LocalTime::LocalTime(const int32_t hours, const int32_t minutes, const int32_t seconds, const int32_t milliseconds) {
  if (!IsInBounds(0, 23, hours)) {
    throw ValidationException("invalid number of hours {}: expected a value in 0-23 range", hours);
  }

  if (!IsInBounds(0, 59, minutes)) {
    throw ValidationException("invalid number of minutes {}: expected a value in 0-59 range", minutes);
  }

  // leap seconds are not representable
  if (!IsInBounds(0, 59, seconds)) {
    throw ValidationException("invalid number of seconds {}: expected a value in 0-59 range", seconds);
  }

  if (!IsInBounds(0, 999, milliseconds)) {
    throw ValidationException("invalid number of milliseconds {}: expected a value in 0-999 range", milliseconds);
  }

  hours_ = hours;
  minutes_ = minutes;
  seconds_ = seconds;
  milliseconds_ = milliseconds;
}

LocalTime LocalTime::FromFieldsUnchecked(utils::PassKey<protocol::TemporalDecoder> /*key*/, const int32_t hours,
                                         const int32_t minutes, const int32_t seconds, const int32_t milliseconds) {
  DEC_ASSERT(IsInBounds(0, 23, hours) && IsInBounds(0, 59, minutes) && IsInBounds(0, 59, seconds) &&
                 IsInBounds(0, 999, milliseconds),
             "Decoded LocalTime {}:{}:{}.{} is out of range", hours, minutes, seconds, milliseconds);
  LocalTime time;
  time.hours_ = hours;
  time.minutes_ = minutes;
  time.seconds_ = seconds;
  time.milliseconds_ = milliseconds;
  return time;
}

int64_t LocalTime::MillisecondsSinceMidnight() const {
  return hours_ * utils::kMillisecondsPerHour + minutes_ * utils::kMillisecondsPerMinute +
         seconds_ * utils::kMillisecondsPerSecond + milliseconds_;
}

std::string LocalTime::ToString() const {
  return fmt::format("{:02}:{:02}:{:02}{}", hours_, minutes_, seconds_, utils::FormatFraction(milliseconds_, 3));
}

std::string LocalTime::ToDebugString() const { return fmt::format("LocalTime [ {} ]", ToString()); }

size_t LocalTimeHash::operator()(const LocalTime &local_time) const {
  return std::hash<int64_t>{}(local_time.MillisecondsSinceMidnight());
}

}  // namespace edgeclient::datatypes
