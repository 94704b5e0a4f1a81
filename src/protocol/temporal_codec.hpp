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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "datatypes/duration.hpp"
#include "datatypes/local_date.hpp"
#include "datatypes/local_date_time.hpp"
#include "datatypes/local_time.hpp"
#include "utils/exceptions.hpp"

namespace edgeclient::protocol {

/**
 * Binary layout of the server's temporal types. All integers are big-endian.
 *
 *   local_date      int32  days since 2000-01-01
 *   local_time      int64  microseconds since midnight
 *   local_datetime  int64  microseconds since 2000-01-01T00:00:00
 *   duration        int64  microseconds, int32 days, int32 months
 */
inline constexpr size_t kLocalDateSize = 4;
inline constexpr size_t kLocalTimeSize = 8;
inline constexpr size_t kLocalDateTimeSize = 8;
inline constexpr size_t kDurationSize = 16;

class EncodeException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(EncodeException)
};

/**
 * Appends wire encodings of temporal values to a caller owned buffer.
 */
class TemporalEncoder {
 public:
  explicit TemporalEncoder(std::vector<uint8_t> &buffer) : buffer_(buffer) {}

  /// @throw EncodeException if the date lies too far from 2000-01-01 for an int32 day count.
  void WriteLocalDate(const datatypes::LocalDate &date);
  void WriteLocalTime(const datatypes::LocalTime &local_time);
  void WriteLocalDateTime(const datatypes::LocalDateTime &local_date_time);
  /// @throw EncodeException if the milliseconds overflow when converted to microseconds.
  void WriteDuration(const datatypes::Duration &duration);

 private:
  void WriteInt32(int32_t value);
  void WriteInt64(int64_t value);

  std::vector<uint8_t> &buffer_;
};

/**
 * Reads temporal values from a byte range, front to back.
 *
 * The decoder is the only caller of the unchecked factories of the temporal
 * types: what the server sends is valid by construction. The Read* methods
 * return std::nullopt when fewer bytes remain than the value needs.
 * Microseconds are reduced to milliseconds, rounding down for instants and
 * times and toward zero for durations.
 */
class TemporalDecoder {
 public:
  explicit TemporalDecoder(std::span<const uint8_t> data) : data_(data) {}

  std::optional<datatypes::LocalDate> ReadLocalDate();
  std::optional<datatypes::LocalTime> ReadLocalTime();
  std::optional<datatypes::LocalDateTime> ReadLocalDateTime();
  std::optional<datatypes::Duration> ReadDuration();

  size_t Remaining() const { return data_.size() - position_; }

 private:
  std::optional<int32_t> ReadInt32();
  std::optional<int64_t> ReadInt64();

  std::span<const uint8_t> data_;
  size_t position_{0};
};

}  // namespace edgeclient::protocol
