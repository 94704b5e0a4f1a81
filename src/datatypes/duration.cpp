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


#include "datatypes/duration.hpp"

#include <cstdlib>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "datatypes/temporal_exceptions.hpp"
#include "utils/calendar.hpp"
#include "utils/fnv.hpp"
#include "utils/iso8601.hpp"

namespace edgeclient::datatypes {

std::string Duration::ToString() const {
  const int64_t years = months_ / 12;
  const int64_t months = months_ % 12;

  auto remainder = milliseconds_;
  const auto hours = remainder / utils::kMillisecondsPerHour;
  if (hours != 0 && (hours < 0) != (milliseconds_ < 0)) {
    throw FormatInvariantException("interval out of range");
  }
  remainder -= hours * utils::kMillisecondsPerHour;
  const auto minutes = remainder / utils::kMillisecondsPerMinute;
  remainder -= minutes * utils::kMillisecondsPerMinute;
  const auto seconds = remainder / utils::kMillisecondsPerSecond;
  const auto fraction = remainder - seconds * utils::kMillisecondsPerSecond;

  std::vector<std::string> parts;
  bool previous_negative = false;
  const auto append_unit = [&](const int64_t value, const std::string_view unit) {
    if (value == 0) {
      return;
    }
    parts.push_back(fmt::format("{}{} {}{}", previous_negative && value > 0 ? "+" : "", value, unit,
                                std::abs(value) == 1 ? "" : "s"));
    previous_negative = value < 0;
  };
  append_unit(years, "year");
  append_unit(months, "month");
  append_unit(days_, "day");

  if (parts.empty() || hours != 0 || minutes != 0 || seconds != 0 || fraction != 0) {
    const bool negative = hours < 0 || minutes < 0 || seconds < 0 || fraction < 0;
    const auto *sign = negative ? "-" : (previous_negative ? "+" : "");
    // the fraction is printed in microseconds
    parts.push_back(fmt::format("{}{:02}:{:02}:{:02}{}", sign, std::abs(hours), std::abs(minutes), std::abs(seconds),
                                utils::FormatFraction(std::abs(fraction) * 1000, 6)));
  }

  return fmt::format("{}", fmt::join(parts, " "));
}

std::string Duration::ToDebugString() const { return fmt::format("Duration [ {} ]", ToString()); }

size_t DurationHash::operator()(const Duration &duration) const {
  const size_t calendar_hash = utils::HashCombine<int32_t, int32_t>{}(duration.Months(), duration.Days());
  return utils::HashCombine<size_t, int64_t>{}(calendar_hash, duration.Milliseconds());
}

}  // namespace edgeclient::datatypes
