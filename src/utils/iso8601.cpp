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

#include "utils/iso8601.hpp"

#include <fmt/format.h>

#include "utils/calendar.hpp"
#include "utils/logging.hpp"

namespace edgeclient::utils {

std::string FormatIsoYear(const int64_t year) {
  if (0 <= year && year <= 9999) {
    return fmt::format("{:04}", year);
  }
  return fmt::format("{}{:06}", year < 0 ? '-' : '+', year < 0 ? -year : year);
}

std::string FormatIsoDate(const int64_t year, const int64_t month, const int64_t day) {
  return fmt::format("{}-{:02}-{:02}", FormatIsoYear(year), month, day);
}

std::string FormatFraction(const int64_t value, const int digits) {
  DEC_ASSERT(value >= 0, "Fraction must not be negative, got {}", value);
  if (value == 0) {
    return {};
  }
  auto result = fmt::format(".{:0>{}}", value, digits);
  result.erase(result.find_last_not_of('0') + 1);
  return result;
}

std::string FormatUtcTimestamp(const int64_t milliseconds_since_epoch) {
  const auto fields = SplitEpochMilliseconds(milliseconds_since_epoch);
  return fmt::format("{}T{:02}:{:02}:{:02}.{:03}Z", FormatIsoDate(fields.date.year, fields.date.month, fields.date.day),
                     fields.hour, fields.minute, fields.second, fields.millisecond);
}

}  // namespace edgeclient::utils
