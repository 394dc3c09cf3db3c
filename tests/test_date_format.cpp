#include <gtest/gtest.h>

#include "core/render/DateFormat.hpp"

using namespace certgen;

TEST(DateFormat, IsoDate) {
  EXPECT_EQ(format_mmddyyyy("2024-03-05"), "03/05/2024");
  EXPECT_EQ(format_mmddyyyy("2024-01-15"), "01/15/2024");
}

TEST(DateFormat, BasicFormat) {
  EXPECT_EQ(format_mmddyyyy("20241231"), "12/31/2024");
}

TEST(DateFormat, DateTimeKeepsCalendarDate) {
  EXPECT_EQ(format_mmddyyyy("2024-03-05T10:30:00"), "03/05/2024");
  EXPECT_EQ(format_mmddyyyy("2024-03-05 23:59"), "03/05/2024");
  EXPECT_EQ(format_mmddyyyy("2024-03-05T10:30:00.123+02:00"), "03/05/2024");
  EXPECT_EQ(format_mmddyyyy("2024-03-05T10:30:00Z"), "03/05/2024");
}

TEST(DateFormat, LeapDays) {
  EXPECT_EQ(format_mmddyyyy("2024-02-29"), "02/29/2024");
  EXPECT_EQ(format_mmddyyyy("2023-02-29"), "2023-02-29");
  EXPECT_EQ(format_mmddyyyy("2000-02-29"), "02/29/2000");
  EXPECT_EQ(format_mmddyyyy("1900-02-29"), "1900-02-29");
}

TEST(DateFormat, IsoWeekDates) {
  EXPECT_EQ(format_mmddyyyy("2024-W10-2"), "03/05/2024");
  EXPECT_EQ(format_mmddyyyy("2024W102"), "03/05/2024");
  EXPECT_EQ(format_mmddyyyy("2024-W10"), "03/04/2024");
  EXPECT_EQ(format_mmddyyyy("2024W10"), "03/04/2024");
  EXPECT_EQ(format_mmddyyyy("2024-W10-2T08:15:00Z"), "03/05/2024");
  // week 1 can start in the previous calendar year
  EXPECT_EQ(format_mmddyyyy("2026-W01-1"), "12/29/2025");
  // 2020 starts on a Wednesday and is a leap year, so it has 53 weeks
  EXPECT_EQ(format_mmddyyyy("2020-W53-5"), "01/01/2021");
}

TEST(DateFormat, InvalidWeekDatesAreReturnedUnchanged) {
  for (const std::string s : {"2021-W53", "2024-W00", "2024-W10-8", "2024-W10-0",
                              "2024-W102", "2024W10-2", "2024-W1"}) {
    EXPECT_EQ(format_mmddyyyy(s), s) << s;
  }
}

TEST(DateFormat, UnparseableIsReturnedUnchanged) {
  for (const std::string s : {"not-a-date", "", "03/05/2024", "2024-13-01", "2024-00-10",
                              "2024-04-31", "2024-3-5", "2024-03-05T25:00", "2024-03-05T"}) {
    EXPECT_EQ(format_mmddyyyy(s), s) << s;
  }
}

TEST(DateFormat, ParseExposesFields) {
  auto d = parse_iso_date("1999-12-01");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->year, 1999);
  EXPECT_EQ(d->month, 12);
  EXPECT_EQ(d->day, 1);
  EXPECT_FALSE(parse_iso_date("1999-12").has_value());
}
