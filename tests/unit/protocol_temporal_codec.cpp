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


#include <cstdint>
#include <limits>
#include <type_traits>
#include <vector>

#include <gtest/gtest.h>

#include "datatypes/duration.hpp"
#include "datatypes/local_date.hpp"
#include "datatypes/local_date_time.hpp"
#include "datatypes/local_time.hpp"
#include "protocol/temporal_codec.hpp"
#include "utils/pass_key.hpp"

using edgeclient::datatypes::Duration;
using edgeclient::datatypes::LocalDate;
using edgeclient::datatypes::LocalDateTime;
using edgeclient::datatypes::LocalTime;
using edgeclient::protocol::EncodeException;
using edgeclient::protocol::TemporalDecoder;
using edgeclient::protocol::TemporalEncoder;

// Only the decoder may use the unchecked factories.
static_assert(!std::is_default_constructible_v<edgeclient::utils::PassKey<TemporalDecoder>>);

struct TemporalCodec : ::testing::Test {
  std::vector<uint8_t> buffer;
  TemporalEncoder encoder{buffer};
};

TEST_F(TemporalCodec, LocalDateLayout) {
  encoder.WriteLocalDate(LocalDate(2000, 0, 1));
  encoder.WriteLocalDate(LocalDate(1999, 11, 31));
  encoder.WriteLocalDate(LocalDate(1970, 0, 1));
  encoder.WriteLocalDate(LocalDate(2000, 0, 2));
  const std::vector<uint8_t> expected{0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF,
                                      0xFF, 0xFF, 0xD5, 0x33, 0x00, 0x00, 0x00, 0x01};
  EXPECT_EQ(buffer, expected);
}

TEST_F(TemporalCodec, LocalTimeLayout) {
  encoder.WriteLocalTime(LocalTime(0, 0, 1));
  encoder.WriteLocalTime(LocalTime(0, 0, 0, 1));
  const std::vector<uint8_t> expected{0x00, 0x00, 0x00, 0x00, 0x00, 0x0F, 0x42, 0x40,
                                      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0xE8};
  EXPECT_EQ(buffer, expected);
}

TEST_F(TemporalCodec, LocalDateTimeLayout) {
  encoder.WriteLocalDateTime(LocalDateTime(2000, 0, 1));
  encoder.WriteLocalDateTime(LocalDateTime(2000, 0, 1, 0, 0, 0, 1));
  encoder.WriteLocalDateTime(LocalDateTime(1999, 11, 31, 23, 59, 59, 999));
  const std::vector<uint8_t> expected{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                      0x00, 0x00, 0x03, 0xE8, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFC, 0x18};
  EXPECT_EQ(buffer, expected);
}

TEST_F(TemporalCodec, DurationLayout) {
  encoder.WriteDuration(Duration(1, 2, 3));
  const std::vector<uint8_t> expected{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x0B, 0xB8,
                                      0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x01};
  EXPECT_EQ(buffer, expected);
}

TEST_F(TemporalCodec, RoundTrip) {
  const LocalDate date(2019, 0, 31);
  const LocalDate ancient_date(-4800, 1, 29);
  const LocalTime time(23, 59, 59, 999);
  const LocalDateTime local_date_time(2019, 0, 31, 13, 14, 15, 16);
  const LocalDateTime before_epoch(1969, 11, 31, 23, 59, 59, 999);
  const Duration duration(-14, 3, -3'661'500);

  encoder.WriteLocalDate(date);
  encoder.WriteLocalDate(ancient_date);
  encoder.WriteLocalTime(time);
  encoder.WriteLocalDateTime(local_date_time);
  encoder.WriteLocalDateTime(before_epoch);
  encoder.WriteDuration(duration);

  TemporalDecoder decoder(buffer);
  EXPECT_EQ(decoder.ReadLocalDate(), date);
  EXPECT_EQ(decoder.ReadLocalDate(), ancient_date);
  EXPECT_EQ(decoder.ReadLocalTime(), time);
  EXPECT_EQ(decoder.ReadLocalDateTime(), local_date_time);
  EXPECT_EQ(decoder.ReadLocalDateTime(), before_epoch);
  EXPECT_EQ(decoder.ReadDuration(), duration);
  EXPECT_EQ(decoder.Remaining(), 0);
}

TEST_F(TemporalCodec, DecodedValuesAreFullyFormed) {
  const std::vector<uint8_t> data{0x00, 0x00, 0x1B, 0x8E, 0x00, 0x00, 0x00, 0x0B, 0xE2, 0xD1, 0x2E, 0x80};
  TemporalDecoder decoder(data);

  // 7054 days after 2000-01-01
  const auto date = decoder.ReadLocalDate();
  ASSERT_TRUE(date);
  EXPECT_EQ(date->Year(), 2019);
  EXPECT_EQ(date->Month(), 3);
  EXPECT_EQ(date->Day(), 25);
  EXPECT_EQ(date->ToString(), "2019-04-25");

  // 51'050'000'000 microseconds after midnight
  const auto time = decoder.ReadLocalTime();
  ASSERT_TRUE(time);
  EXPECT_EQ(time->ToString(), "14:10:50");
  EXPECT_EQ(*time, LocalTime(14, 10, 50));
}

TEST_F(TemporalCodec, LargestWireDateDecodes) {
  const std::vector<uint8_t> data{0x7F, 0xFF, 0xFF, 0xFF, 0x80, 0x00, 0x00, 0x00};
  TemporalDecoder decoder(data);
  const auto latest = decoder.ReadLocalDate();
  const auto earliest = decoder.ReadLocalDate();
  ASSERT_TRUE(latest);
  ASSERT_TRUE(earliest);
  EXPECT_LT(*earliest, *latest);
  EXPECT_EQ(latest->ToOrdinal() - LocalDate(2000, 0, 1).ToOrdinal(), std::numeric_limits<int32_t>::max());
  EXPECT_EQ(earliest->ToOrdinal() - LocalDate(2000, 0, 1).ToOrdinal(), std::numeric_limits<int32_t>::min());

  encoder.WriteLocalDate(*latest);
  encoder.WriteLocalDate(*earliest);
  EXPECT_EQ(buffer, data);
}

TEST_F(TemporalCodec, MicrosecondsAreReducedToMilliseconds) {
  // local_time 1999us, local_datetime -1us, duration -1500us 0 days 0 months
  const std::vector<uint8_t> data{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x07, 0xCF, 0xFF, 0xFF, 0xFF, 0xFF,
                                  0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFA, 0x24,
                                  0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  TemporalDecoder decoder(data);
  EXPECT_EQ(decoder.ReadLocalTime(), LocalTime(0, 0, 0, 1));
  const auto local_date_time = decoder.ReadLocalDateTime();
  ASSERT_TRUE(local_date_time);
  EXPECT_EQ(local_date_time->ToString(), "1999-12-31T23:59:59.999");
  EXPECT_EQ(decoder.ReadDuration(), Duration(0, 0, -1));
}

TEST_F(TemporalCodec, TruncatedInput) {
  {
    const std::vector<uint8_t> data{0x00, 0x00, 0x00};
    TemporalDecoder decoder(data);
    EXPECT_FALSE(decoder.ReadLocalDate());
  }
  {
    const std::vector<uint8_t> data(7, 0x00);
    TemporalDecoder decoder(data);
    EXPECT_FALSE(decoder.ReadLocalTime());
  }
  {
    const std::vector<uint8_t> data;
    TemporalDecoder decoder(data);
    EXPECT_FALSE(decoder.ReadLocalDateTime());
  }
  {
    const std::vector<uint8_t> data(15, 0x00);
    TemporalDecoder decoder(data);
    EXPECT_FALSE(decoder.ReadDuration());
    EXPECT_EQ(decoder.Remaining(), 15);
  }
}

TEST_F(TemporalCodec, TimeOfDayOutOfRange) {
  // 86'400'000'000 microseconds is midnight of the following day
  const std::vector<uint8_t> past_midnight{0x00, 0x00, 0x00, 0x14, 0x1D, 0xD7, 0x60, 0x00};
  TemporalDecoder decoder(past_midnight);
  EXPECT_FALSE(decoder.ReadLocalTime());

  const std::vector<uint8_t> negative{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
  TemporalDecoder negative_decoder(negative);
  EXPECT_FALSE(negative_decoder.ReadLocalTime());
}

TEST_F(TemporalCodec, LocalDateTimeOutOfRange) {
  const std::vector<uint8_t> data{0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
                                  0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  TemporalDecoder decoder(data);
  EXPECT_FALSE(decoder.ReadLocalDateTime());
  EXPECT_FALSE(decoder.ReadLocalDateTime());
  EXPECT_EQ(decoder.Remaining(), 0);
}

TEST_F(TemporalCodec, LocalDateTimeRangeLimits) {
  const LocalDateTime latest(275760, 8, 13);
  const LocalDateTime earliest(-271821, 3, 20);
  encoder.WriteLocalDateTime(latest);
  encoder.WriteLocalDateTime(earliest);

  TemporalDecoder decoder(buffer);
  const auto decoded_latest = decoder.ReadLocalDateTime();
  const auto decoded_earliest = decoder.ReadLocalDateTime();
  ASSERT_TRUE(decoded_latest);
  ASSERT_TRUE(decoded_earliest);
  EXPECT_EQ(decoded_latest->MillisecondsSinceEpoch(), edgeclient::datatypes::kMaxMillisecondsFromEpoch);
  EXPECT_EQ(decoded_earliest->MillisecondsSinceEpoch(), -edgeclient::datatypes::kMaxMillisecondsFromEpoch);
  EXPECT_EQ(LocalDateTime(decoded_latest->Date(), decoded_latest->Time()), latest);
}

TEST_F(TemporalCodec, EncodeOutOfRange) {
  EXPECT_THROW(encoder.WriteLocalDate(LocalDate(6'000'000, 0, 1)), EncodeException);
  EXPECT_THROW(encoder.WriteDuration(Duration(0, 0, std::numeric_limits<int64_t>::max())), EncodeException);
  EXPECT_THROW(encoder.WriteDuration(Duration(0, 0, std::numeric_limits<int64_t>::min())), EncodeException);
  EXPECT_TRUE(buffer.empty());
}
