#include <gtest/gtest.h>
#include "DateUtils.hpp"

using namespace settlement;

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Разбор дат
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DateUtilsTest, ParsesIsoDate) {
    auto result = parseDateString("2015-03-01");

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(*result, makeDate(2015, 3, 1));
    EXPECT_FALSE(hasTimeOfDay(*result));
}

TEST(DateUtilsTest, ParsesUsDate) {
    auto result = parseDateString("04/28/2015");

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(*result, makeDate(2015, 4, 28));
}

TEST(DateUtilsTest, ParsesCompactDate) {
    auto result = parseDateString("20190808");

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(*result, makeDate(2019, 8, 8));
}

TEST(DateUtilsTest, ParsesDateWithTime) {
    auto withSeconds = parseDateString("2015-04-28 15:07:30");
    auto withMinutes = parseDateString("2015-04-28T15:10");
    auto usWithTime = parseDateString("04/28/2015 15:06");

    ASSERT_TRUE(withSeconds.has_value());
    ASSERT_TRUE(withMinutes.has_value());
    ASSERT_TRUE(usWithTime.has_value());

    EXPECT_EQ(*withSeconds, makeDate(2015, 4, 28, 15, 7, 30));
    EXPECT_EQ(*withMinutes, makeDate(2015, 4, 28, 15, 10));
    EXPECT_EQ(*usWithTime, makeDate(2015, 4, 28, 15, 6));
    EXPECT_TRUE(hasTimeOfDay(*withMinutes));
}

TEST(DateUtilsTest, TrimsSurroundingWhitespace) {
    auto result = parseDateString("  2015-03-01  ");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, makeDate(2015, 3, 1));
}

TEST(DateUtilsTest, RejectsInvalidDates) {
    EXPECT_FALSE(parseDateString("").has_value());
    EXPECT_FALSE(parseDateString("not a date").has_value());
    EXPECT_FALSE(parseDateString("2015-02-30").has_value());
    EXPECT_FALSE(parseDateString("20151301").has_value());
    EXPECT_FALSE(parseDateString("2015-03-01 garbage").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Нормализация и форматирование
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DateUtilsTest, NormalizeDropsTimeOfDay) {
    auto date = makeDate(2015, 4, 28, 15, 7, 0);

    EXPECT_EQ(normalizeDate(date), makeDate(2015, 4, 28));
    EXPECT_EQ(timeOfDay(date), std::chrono::seconds(15 * 3600 + 7 * 60));
    EXPECT_TRUE(isSameDay(date, makeDate(2015, 4, 28, 23, 59, 59)));
    EXPECT_FALSE(isSameDay(date, makeDate(2015, 4, 29)));
}

TEST(DateUtilsTest, NormalizeBeforeEpoch) {
    auto date = makeDate(1969, 12, 31, 12, 0, 0);

    EXPECT_EQ(normalizeDate(date), makeDate(1969, 12, 31));
}

TEST(DateUtilsTest, AddDaysAcrossMonthBoundary) {
    EXPECT_EQ(addDays(makeDate(2015, 2, 6), -1), makeDate(2015, 2, 5));
    EXPECT_EQ(addDays(makeDate(2015, 7, 31), 1), makeDate(2015, 8, 1));
}

TEST(DateUtilsTest, Formatting) {
    EXPECT_EQ(formatDate(makeDate(2015, 3, 1)), "2015-03-01");
    EXPECT_EQ(formatDateTime(makeDate(2015, 3, 1)), "2015-03-01");
    EXPECT_EQ(formatDateTime(makeDate(2015, 4, 28, 15, 10)), "2015-04-28 15:10:00");
    EXPECT_EQ(formatMonthKey(makeDate(2019, 8, 8)), "2019-08");
}
