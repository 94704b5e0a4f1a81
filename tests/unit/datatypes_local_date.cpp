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
#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "datatypes/local_date.hpp"
#include "datatypes/temporal_exceptions.hpp"
#include "utils/exceptions.hpp"

using edgeclient::datatypes::LocalDate;
using edgeclient::datatypes::LocalDateHash;
using edgeclient::datatypes::ValidationException;

namespace {

struct TestDateParameters {
  int32_t year;
  int32_t month;
  int32_t day;
  bool should_throw;
};

inline constexpr std::array test_dates{
    TestDateParameters{1996, -1, 22, true},  TestDateParameters{1996, 12, 22, true},
    TestDateParameters{1996, 10, -22, true}, TestDateParameters{1996, 10, 0, true},
    TestDateParameters{1, 11, 32, true},     TestDateParameters{1, 1, 29, true},
    TestDateParameters{2020, 1, 29, false},  TestDateParameters{1700, 1, 29, true},
    TestDateParameters{1200, 1, 29, false},  TestDateParameters{0, 1, 29, false},
    TestDateParameters{-1, 1, 29, true},     TestDateParameters{10000, 11, 31, false},
    TestDateParameters{-5000, 0, 1, false},  TestDateParameters{2019, 3, 31, true}};

std::string ValidationMessage(const int32_t year, const int32_t month, const int32_t day) {
  try {
    LocalDate date(year, month, day);
  } catch (const ValidationException &e) {
    return e.what();
  }
  return {};
}

}  // namespace

TEST(LocalDateTest, Construction) {
  std::optional<LocalDate> test_date;

  for (const auto [year, month, day, should_throw] : test_dates) {
    if (should_throw) {
      EXPECT_THROW(test_date.emplace(year, month, day), edgeclient::utils::BasicException)
          << year << "-" << month << "-" << day;
    } else {
      EXPECT_NO_THROW(test_date.emplace(year, month, day)) << year << "-" << month << "-" << day;
    }
  }
}

TEST(LocalDateTest, ValidationMessages) {
  EXPECT_EQ(ValidationMessage(2019, 12, 1), "invalid month index 12: expected a value in 0-11 range");
  EXPECT_EQ(ValidationMessage(2019, -1, 1), "invalid month index -1: expected a value in 0-11 range");
  EXPECT_EQ(ValidationMessage(2019, 1, 30), "invalid number of days 30: expected a value in 1-28 range");
  EXPECT_EQ(ValidationMessage(2020, 1, 30), "invalid number of days 30: expected a value in 1-29 range");
  EXPECT_EQ(ValidationMessage(2019, 3, 0), "invalid number of days 0: expected a value in 1-30 range");
}

TEST(LocalDateTest, Defaults) {
  const LocalDate date(2019);
  EXPECT_EQ(date.Year(), 2019);
  EXPECT_EQ(date.Month(), 0);
  EXPECT_EQ(date.Day(), 1);
  EXPECT_EQ(date, LocalDate(2019, 0, 1));
}

TEST(LocalDateTest, Accessors) {
  const LocalDate date(2019, 0, 31);
  EXPECT_EQ(date.Year(), 2019);
  EXPECT_EQ(date.Month(), 0);
  EXPECT_EQ(date.Day(), 31);
  EXPECT_EQ(LocalDate(1970, 0, 1).DaysSinceEpoch(), 0);
  EXPECT_EQ(LocalDate(1969, 11, 31).DaysSinceEpoch(), -1);
  EXPECT_EQ(LocalDate(2000, 0, 1).DaysSinceEpoch(), 10957);
  EXPECT_EQ(LocalDate(1, 0, 1).ToOrdinal(), 1);
}

TEST(LocalDateTest, OrdinalArithmetic) {
  const LocalDate date(2019, 0, 31);
  EXPECT_EQ(LocalDate::FromOrdinal(date.ToOrdinal() + 1), LocalDate(2019, 1, 1));
  EXPECT_EQ(LocalDate::FromOrdinal(date.ToOrdinal() + 29), LocalDate(2019, 2, 1));
  EXPECT_EQ(LocalDate::FromOrdinal(LocalDate(2020, 1, 28).ToOrdinal() + 1), LocalDate(2020, 1, 29));
  EXPECT_EQ(LocalDate::FromOrdinal(LocalDate(2019, 0, 1).ToOrdinal() - 1), LocalDate(2018, 11, 31));
  EXPECT_EQ(LocalDate::FromOrdinal(1), LocalDate(1, 0, 1));
  EXPECT_EQ(LocalDate::FromOrdinal(0), LocalDate(0, 11, 31));
  EXPECT_EQ(LocalDate(2019, 2, 1).ToOrdinal() - LocalDate(2019, 1, 1).ToOrdinal(), 28);

  EXPECT_THROW(LocalDate::FromOrdinal(std::numeric_limits<int64_t>::max() / 2), ValidationException);
  EXPECT_THROW(LocalDate::FromOrdinal(std::numeric_limits<int64_t>::max()), ValidationException);
  EXPECT_THROW(LocalDate::FromOrdinal(std::numeric_limits<int64_t>::min()), ValidationException);
}

TEST(LocalDateTest, OrdinalLimits) {
  const LocalDate latest(std::numeric_limits<int32_t>::max(), 11, 31);
  const LocalDate earliest(std::numeric_limits<int32_t>::min(), 0, 1);
  EXPECT_EQ(LocalDate::FromOrdinal(latest.ToOrdinal()), latest);
  EXPECT_EQ(LocalDate::FromOrdinal(earliest.ToOrdinal()), earliest);
  EXPECT_THROW(LocalDate::FromOrdinal(latest.ToOrdinal() + 1), ValidationException);
  EXPECT_THROW(LocalDate::FromOrdinal(earliest.ToOrdinal() - 1), ValidationException);
}

TEST(LocalDateTest, ConvertsToString) {
  EXPECT_EQ(LocalDate(2019, 0, 31).ToString(), "2019-01-31");
  EXPECT_EQ(LocalDate(1, 11, 5).ToString(), "0001-12-05");
  EXPECT_EQ(LocalDate(0, 1, 29).ToString(), "0000-02-29");
  EXPECT_EQ(LocalDate(10000, 0, 1).ToString(), "+010000-01-01");
  EXPECT_EQ(LocalDate(-1, 11, 31).ToString(), "-000001-12-31");
}

TEST(LocalDateTest, Print) {
  const LocalDate date(2019, 0, 31);
  std::ostringstream stream;
  stream << date;
  ASSERT_TRUE(stream);
  EXPECT_EQ(stream.view(), "LocalDate [ 2019-01-31 ]");
  EXPECT_EQ(fmt::format("{}", date), "LocalDate [ 2019-01-31 ]");
  EXPECT_EQ(date.ToDebugString(), "LocalDate [ 2019-01-31 ]");
}

TEST(LocalDateTest, OrderingAndHash) {
  EXPECT_LT(LocalDate(2019, 0, 31), LocalDate(2019, 1, 1));
  EXPECT_LT(LocalDate(2018, 11, 31), LocalDate(2019, 0, 1));
  EXPECT_LT(LocalDate(-1, 11, 31), LocalDate(0, 0, 1));
  EXPECT_GT(LocalDate(2019, 1, 2), LocalDate(2019, 1, 1));
  EXPECT_NE(LocalDate(2019, 1, 1), LocalDate(2019, 0, 1));

  const LocalDate date(2019, 0, 31);
  EXPECT_EQ(LocalDateHash{}(date), LocalDateHash{}(LocalDate::FromOrdinal(date.ToOrdinal())));
  std::unordered_set<LocalDate, LocalDateHash> dates{LocalDate(2019, 0, 31), LocalDate(2019, 0, 31),
                                                     LocalDate(2019, 1, 1)};
  EXPECT_EQ(dates.size(), 2);
}
