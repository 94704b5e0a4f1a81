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


#include "protocol/temporal_codec.hpp"

#include <cstring>
#include <limits>

#include "utils/calendar.hpp"
#include "utils/endian.hpp"
#include "utils/logging.hpp"
#include "utils/pass_key.hpp"

namespace edgeclient::protocol {
namespace {

constexpr int64_t kMicrosecondsPerMillisecond = 1'000;
constexpr int64_t kMicrosecondsPerDay = utils::kMillisecondsPerDay * kMicrosecondsPerMillisecond;
// 2000-01-01T00:00:00 in milliseconds since the Unix epoch
constexpr int64_t kServerEpochMilliseconds =
    (utils::kServerEpochOrdinal - utils::kUnixEpochOrdinal) * utils::kMillisecondsPerDay;

}  // namespace

void TemporalEncoder::WriteInt32(const int32_t value) {
  const auto big_endian = utils::HostToBigEndian(value);
  const auto *bytes = reinterpret_cast<const uint8_t *>(&big_endian);
  buffer_.insert(buffer_.end(), bytes, bytes + sizeof(big_endian));
}

void TemporalEncoder::WriteInt64(const int64_t value) {
  const auto big_endian = utils::HostToBigEndian(value);
  const auto *bytes = reinterpret_cast<const uint8_t *>(&big_endian);
  buffer_.insert(buffer_.end(), bytes, bytes + sizeof(big_endian));
}

void TemporalEncoder::WriteLocalDate(const datatypes::LocalDate &date) {
  const auto days = date.ToOrdinal() - utils::kServerEpochOrdinal;
  if (days < std::numeric_limits<int32_t>::min() || days > std::numeric_limits<int32_t>::max()) {
    throw EncodeException("LocalDate {} is out of the range of the wire format", date.ToString());
  }
  WriteInt32(static_cast<int32_t>(days));
}

void TemporalEncoder::WriteLocalTime(const datatypes::LocalTime &local_time) {
  WriteInt64(local_time.MillisecondsSinceMidnight() * kMicrosecondsPerMillisecond);
}

void TemporalEncoder::WriteLocalDateTime(const datatypes::LocalDateTime &local_date_time) {
  // LocalDateTime stays within 8.64e15 ms of the Unix epoch, so this cannot overflow
  WriteInt64((local_date_time.MillisecondsSinceEpoch() - kServerEpochMilliseconds) * kMicrosecondsPerMillisecond);
}

void TemporalEncoder::WriteDuration(const datatypes::Duration &duration) {
  static constexpr int64_t kMaxMilliseconds = std::numeric_limits<int64_t>::max() / kMicrosecondsPerMillisecond;
  const auto milliseconds = duration.Milliseconds();
  if (milliseconds > kMaxMilliseconds || milliseconds < -kMaxMilliseconds) {
    throw EncodeException("Duration {} is out of the range of the wire format", duration.ToString());
  }
  WriteInt64(milliseconds * kMicrosecondsPerMillisecond);
  WriteInt32(duration.Days());
  WriteInt32(duration.Months());
}

std::optional<int32_t> TemporalDecoder::ReadInt32() {
  if (Remaining() < sizeof(int32_t)) {
    return std::nullopt;
  }
  int32_t value{0};
  std::memcpy(&value, data_.data() + position_, sizeof(value));
  position_ += sizeof(value);
  return utils::BigEndianToHost(value);
}

std::optional<int64_t> TemporalDecoder::ReadInt64() {
  if (Remaining() < sizeof(int64_t)) {
    return std::nullopt;
  }
  int64_t value{0};
  std::memcpy(&value, data_.data() + position_, sizeof(value));
  position_ += sizeof(value);
  return utils::BigEndianToHost(value);
}

std::optional<datatypes::LocalDate> TemporalDecoder::ReadLocalDate() {
  const auto days = ReadInt32();
  if (!days) {
    spdlog::warn("[ReadLocalDate] Missing data!");
    return std::nullopt;
  }
  return datatypes::LocalDate::FromOrdinalUnchecked(utils::PassKey<TemporalDecoder>{},
                                                    utils::kServerEpochOrdinal + *days);
}

std::optional<datatypes::LocalTime> TemporalDecoder::ReadLocalTime() {
  const auto microseconds = ReadInt64();
  if (!microseconds) {
    spdlog::warn("[ReadLocalTime] Missing data!");
    return std::nullopt;
  }
  if (*microseconds < 0 || *microseconds >= kMicrosecondsPerDay) {
    spdlog::warn("[ReadLocalTime] {} microseconds is not a time of day!", *microseconds);
    return std::nullopt;
  }

  auto milliseconds = *microseconds / kMicrosecondsPerMillisecond;
  const auto hours = milliseconds / utils::kMillisecondsPerHour;
  milliseconds %= utils::kMillisecondsPerHour;
  const auto minutes = milliseconds / utils::kMillisecondsPerMinute;
  milliseconds %= utils::kMillisecondsPerMinute;
  const auto seconds = milliseconds / utils::kMillisecondsPerSecond;
  milliseconds %= utils::kMillisecondsPerSecond;
  return datatypes::LocalTime::FromFieldsUnchecked(utils::PassKey<TemporalDecoder>{}, static_cast<int32_t>(hours),
                                                   static_cast<int32_t>(minutes), static_cast<int32_t>(seconds),
                                                   static_cast<int32_t>(milliseconds));
}

std::optional<datatypes::LocalDateTime> TemporalDecoder::ReadLocalDateTime() {
  const auto microseconds = ReadInt64();
  if (!microseconds) {
    spdlog::warn("[ReadLocalDateTime] Missing data!");
    return std::nullopt;
  }
  const auto milliseconds = utils::FloorDiv(*microseconds, kMicrosecondsPerMillisecond) + kServerEpochMilliseconds;
  if (milliseconds < -datatypes::kMaxMillisecondsFromEpoch || milliseconds > datatypes::kMaxMillisecondsFromEpoch) {
    spdlog::warn("[ReadLocalDateTime] {} microseconds is out of the LocalDateTime range!", *microseconds);
    return std::nullopt;
  }
  return datatypes::LocalDateTime::FromMillisecondsSinceEpoch(utils::PassKey<TemporalDecoder>{}, milliseconds);
}

std::optional<datatypes::Duration> TemporalDecoder::ReadDuration() {
  // all or nothing, a short buffer leaves the position untouched
  if (Remaining() < kDurationSize) {
    spdlog::warn("[ReadDuration] Missing data!");
    return std::nullopt;
  }
  const auto microseconds = ReadInt64();
  const auto days = ReadInt32();
  const auto months = ReadInt32();
  EC_ASSERT(microseconds && days && months, "Duration read past the checked buffer size");
  return datatypes::Duration(*months, *days, *microseconds / kMicrosecondsPerMillisecond);
}

}  // namespace edgeclient::protocol
