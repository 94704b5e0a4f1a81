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


#include <array>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gflags/gflags.h>

#include "datatypes/duration.hpp"
#include "datatypes/local_date.hpp"
#include "datatypes/local_date_time.hpp"
#include "datatypes/local_time.hpp"
#include "flags/log_level.hpp"
#include "helpers.hpp"
#include "protocol/temporal_codec.hpp"
#include "utils/enum.hpp"
#include "utils/exceptions.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

using namespace std::string_view_literals;

namespace {

enum class TemporalType : uint8_t { Date, Time, DateTime, Duration };

inline constexpr std::array kTemporalTypeMappings{
    std::pair{"date"sv, TemporalType::Date}, std::pair{"time"sv, TemporalType::Time},
    std::pair{"datetime"sv, TemporalType::DateTime}, std::pair{"duration"sv, TemporalType::Duration}};

const std::string type_help_string =
    fmt::format("Temporal type to inspect. Allowed values: {}",
                edgeclient::utils::GetAllowedEnumValuesString(kTemporalTypeMappings));

}  // namespace

DEFINE_VALIDATED_string(type, "datetime", type_help_string.c_str(), {
  if (!edgeclient::utils::ValidateEnumValueString(value, kTemporalTypeMappings)) return true;
  std::cout << "Expected --" << flagname << " to be one of: "
            << edgeclient::utils::GetAllowedEnumValuesString(kTemporalTypeMappings) << std::endl;
  return false;
});

DEFINE_int32(year, 1970, "Year of a date or datetime.");
DEFINE_int32(month, 0, "Zero-based month of a date or datetime.");
DEFINE_int32(day, 1, "Day of the month of a date or datetime.");
DEFINE_int32(hour, 0, "Hour of a time or datetime.");
DEFINE_int32(minute, 0, "Minute of a time or datetime.");
DEFINE_int32(second, 0, "Second of a time or datetime.");
DEFINE_int32(millisecond, 0, "Millisecond of a time or datetime.");

DEFINE_int32(months, 0, "Months component of a duration.");
DEFINE_int32(days, 0, "Days component of a duration.");
DEFINE_int64(milliseconds, 0, "Milliseconds component of a duration.");

DEFINE_string(wire_hex, "",
              "Wire encoding of a value of --type as hex digits. When set, the value is decoded from it instead of "
              "being built from the field flags.");

namespace {

namespace datatypes = edgeclient::datatypes;
namespace protocol = edgeclient::protocol;

std::vector<uint8_t> ParseHex(const std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw edgeclient::utils::BasicException("--wire_hex must have an even number of hex digits, got {}", hex.size());
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    uint8_t byte{0};
    if (const auto [p, ec] = std::from_chars(hex.data() + i, hex.data() + i + 2, byte, 16);
        ec != std::errc() || p != hex.data() + i + 2) {
      throw edgeclient::utils::BasicException("--wire_hex has an invalid byte '{}' at offset {}", hex.substr(i, 2),
                                              i);
    }
    bytes.push_back(byte);
  }
  return bytes;
}

template <typename TValue>
void Report(const TValue &value, void (protocol::TemporalEncoder::*write)(const TValue &)) {
  std::vector<uint8_t> wire;
  protocol::TemporalEncoder encoder(wire);
  (encoder.*write)(value);
  fmt::print("canonical: {}\ndebug:     {}\nwire:      {:02x}\n", value.ToString(), value, fmt::join(wire, ""));
}

template <typename TValue>
bool ReportDecoded(const std::optional<TValue> &value, void (protocol::TemporalEncoder::*write)(const TValue &),
                   const protocol::TemporalDecoder &decoder) {
  if (!value) {
    spdlog::error("--wire_hex does not hold a valid {} value", FLAGS_type);
    return false;
  }
  if (decoder.Remaining() != 0) {
    spdlog::warn("Ignoring {} bytes after the decoded {} value", decoder.Remaining(), FLAGS_type);
  }
  Report(*value, write);
  return true;
}

bool Decode(const TemporalType type) {
  const auto bytes = ParseHex(FLAGS_wire_hex);
  spdlog::debug("Decoding {} bytes as {}", bytes.size(), FLAGS_type);
  protocol::TemporalDecoder decoder(bytes);
  switch (type) {
    case TemporalType::Date:
      return ReportDecoded(decoder.ReadLocalDate(), &protocol::TemporalEncoder::WriteLocalDate, decoder);
    case TemporalType::Time:
      return ReportDecoded(decoder.ReadLocalTime(), &protocol::TemporalEncoder::WriteLocalTime, decoder);
    case TemporalType::DateTime:
      return ReportDecoded(decoder.ReadLocalDateTime(), &protocol::TemporalEncoder::WriteLocalDateTime, decoder);
    case TemporalType::Duration:
      return ReportDecoded(decoder.ReadDuration(), &protocol::TemporalEncoder::WriteDuration, decoder);
  }
  LOG_FATAL("Decode of a TemporalType -> check missing switch case");
}

void Build(const TemporalType type) {
  spdlog::debug("Building {} from flags", FLAGS_type);
  switch (type) {
    case TemporalType::Date:
      Report(datatypes::LocalDate(FLAGS_year, FLAGS_month, FLAGS_day), &protocol::TemporalEncoder::WriteLocalDate);
      return;
    case TemporalType::Time:
      Report(datatypes::LocalTime(FLAGS_hour, FLAGS_minute, FLAGS_second, FLAGS_millisecond),
             &protocol::TemporalEncoder::WriteLocalTime);
      return;
    case TemporalType::DateTime:
      Report(datatypes::LocalDateTime(FLAGS_year, FLAGS_month, FLAGS_day, FLAGS_hour, FLAGS_minute, FLAGS_second,
                                      FLAGS_millisecond),
             &protocol::TemporalEncoder::WriteLocalDateTime);
      return;
    case TemporalType::Duration:
      Report(datatypes::Duration(FLAGS_months, FLAGS_days, FLAGS_milliseconds),
             &protocol::TemporalEncoder::WriteDuration);
      return;
  }
  LOG_FATAL("Build of a TemporalType -> check missing switch case");
}

}  // namespace

int main(int argc, char *argv[]) {
  gflags::SetUsageMessage(
      "Print the canonical form, debug form and wire encoding of a temporal value built from flags or decoded from "
      "hex.");

  // Load config before parsing arguments, so that flags from the command line
  // overwrite the config.
  LoadConfig("edgeclient_temporal");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  edgeclient::flags::InitializeLogger();

  const auto type = edgeclient::utils::StringToEnum<TemporalType>(FLAGS_type, kTemporalTypeMappings);
  EC_ASSERT(type, "--type {} passed validation but has no mapping", FLAGS_type);

  try {
    if (!FLAGS_wire_hex.empty()) {
      return Decode(*type) ? 0 : 1;
    }
    Build(*type);
  } catch (const edgeclient::utils::BasicException &e) {
    spdlog::critical("{}: {}", e.name(), e.what());
    return 1;
  }
  return 0;
}
