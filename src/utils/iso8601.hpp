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
#include <string>

namespace edgeclient::utils {

/**
 * Years 0-9999 are written with four digits. Other years use the ISO 8601
 * expanded representation: an explicit sign followed by six digits.
 */
std::string FormatIsoYear(int64_t year);

// `YYYY-MM-DD`, month and day 1-based.
std::string FormatIsoDate(int64_t year, int64_t month, int64_t day);

/**
 * Renders a decimal fraction of `digits` digits. Returns an empty string for
 * zero, otherwise '.' followed by the zero-padded value with its trailing
 * zeros removed (500 with 3 digits is ".5").
 */
std::string FormatFraction(int64_t value, int digits);

/**
 * Renders a UTC instant given in milliseconds since the Unix epoch as
 * `YYYY-MM-DDTHH:MM:SS.mmmZ`. The output always carries the three millisecond
 * digits and the trailing `Z`.
 */
std::string FormatUtcTimestamp(int64_t milliseconds_since_epoch);

}  // namespace edgeclient::utils
