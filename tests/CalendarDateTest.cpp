#include "courtsched/core/schedule/CalendarDate.h"

#include <gtest/gtest.h>

using courtsched::core::schedule::CalendarDate;

TEST(CalendarDateTest, WeekdayOfKnownDates) {
    EXPECT_EQ((CalendarDate{1970, 1, 1}.Weekday()), 4);
    EXPECT_EQ((CalendarDate{2000, 1, 1}.Weekday()), 6);
    EXPECT_EQ((CalendarDate{2024, 2, 29}.Weekday()), 4);
    EXPECT_EQ((CalendarDate{2026, 10, 19}.Weekday()), 1);
    EXPECT_EQ((CalendarDate{1969, 12, 28}.Weekday()), 0);
}

TEST(CalendarDateTest, AddDaysCrossesMonthAndYear) {
    EXPECT_EQ(CalendarDate({2026, 12, 30}).AddDays(7), (CalendarDate{2027, 1, 6}));
    EXPECT_EQ(CalendarDate({2024, 2, 27}).AddDays(2), (CalendarDate{2024, 2, 29}));
    EXPECT_EQ(CalendarDate({2023, 2, 27}).AddDays(2), (CalendarDate{2023, 3, 1}));
}

TEST(CalendarDateTest, DayNumberRoundTrip) {
    const CalendarDate date{2031, 7, 15};
    EXPECT_EQ(CalendarDate::FromDayNumber(date.ToDayNumber()), date);
    EXPECT_EQ(CalendarDate({1970, 1, 1}).ToDayNumber(), 0);
}

TEST(CalendarDateTest, ParsesIsoDates) {
    CalendarDate date;
    ASSERT_TRUE(CalendarDate::ParseIso("2026-01-05", date));
    EXPECT_EQ(date, (CalendarDate{2026, 1, 5}));
    EXPECT_EQ(date.ToIsoString(), "2026-01-05");
}

TEST(CalendarDateTest, RejectsMalformedDates) {
    CalendarDate date{2020, 5, 5};
    EXPECT_FALSE(CalendarDate::ParseIso("2026-1-05", date));
    EXPECT_FALSE(CalendarDate::ParseIso("2026-02-30", date));
    EXPECT_FALSE(CalendarDate::ParseIso("2026-13-01", date));
    EXPECT_FALSE(CalendarDate::ParseIso("20x6-01-01", date));
    EXPECT_FALSE(CalendarDate::ParseIso("", date));
    EXPECT_EQ(date, (CalendarDate{2020, 5, 5}));
}
