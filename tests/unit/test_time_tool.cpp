#include <gtest/gtest.h>
#include "mcpipboy/error.hpp"
#include "mcpipboy/tools/time.hpp"
#include <cstdlib>
#include <ctime>

using namespace mcpipboy;
using namespace mcpipboy::tools;

namespace {

// Wednesday 2025-01-15T10:30:00Z
const std::chrono::system_clock::time_point kNow{std::chrono::seconds{1736937000}};

TimePoint now_point() { return TimePoint::from(kNow); }

std::string parse_utc(const std::string& text) {
    return TimeTool::format_time(TimeTool::parse_time(text, now_point()), "iso", "utc");
}

std::string parse_error(const std::string& text) {
    try {
        (void)TimeTool::parse_time(text, now_point());
    } catch (const ExecutionError& e) {
        return e.what();
    }
    ADD_FAILURE() << "expected ExecutionError for " << text;
    return {};
}

class TimeToolTest : public ::testing::Test {
protected:
    TimeToolTest() : tool_(std::make_shared<FixedClock>(kNow)) {}

    std::string run(const nlohmann::json& args) {
        return tool_.execute(args).get<std::string>();
    }

    TimeTool tool_;
};

} // namespace

// ---- Formats ----

TEST(TimeFormat, AllFormatsInUtc) {
    TimePoint t = now_point();
    EXPECT_EQ(TimeTool::format_time(t, "iso", "utc"), "2025-01-15T10:30:00Z");
    EXPECT_EQ(TimeTool::format_time(t, "rfc3339", "UTC"), "2025-01-15T10:30:00Z");
    EXPECT_EQ(TimeTool::format_time(t, "unix", "utc"), "1736937000");
    EXPECT_EQ(TimeTool::format_time(t, "date", "utc"), "2025-01-15");
    EXPECT_EQ(TimeTool::format_time(t, "datetime", "utc"), "2025-01-15 10:30:00");
    EXPECT_EQ(TimeTool::format_time(t, "time", "utc"), "10:30:00");
    EXPECT_EQ(TimeTool::format_time(t, "weekday", "utc"), "Wednesday, January 15, 2025");
}

TEST(TimeFormat, WeekdayDayHasNoPadding) {
    TimePoint t = TimeTool::parse_time("2025-03-05", now_point());
    EXPECT_EQ(TimeTool::format_time(t, "weekday", "utc"), "Wednesday, March 5, 2025");
}

TEST(TimeFormat, NamedZoneOffset) {
    if (!TimeTool::is_valid_timezone("Asia/Tokyo")) {
        GTEST_SKIP() << "zoneinfo database not installed";
    }
    EXPECT_EQ(TimeTool::format_time(now_point(), "iso", "Asia/Tokyo"), "2025-01-15T19:30:00+09:00");
    EXPECT_EQ(TimeTool::format_time(now_point(), "time", "Asia/Tokyo"), "19:30:00");
}

TEST(TimeFormat, LocalFollowsTzEnvironment) {
    const char* old = std::getenv("TZ");
    std::string saved = old ? old : "";
    setenv("TZ", "XYZ-2", 1);
    tzset();
    std::string formatted = TimeTool::format_time(now_point(), "iso", "local");
    if (old) {
        setenv("TZ", saved.c_str(), 1);
    } else {
        unsetenv("TZ");
    }
    tzset();
    EXPECT_EQ(formatted, "2025-01-15T12:30:00+02:00");
}

// ---- Parsing ----

TEST(TimeParse, RelativeDays) {
    EXPECT_EQ(parse_utc("now"), "2025-01-15T10:30:00Z");
    EXPECT_EQ(parse_utc("today"), "2025-01-15T00:00:00Z");
    EXPECT_EQ(parse_utc("Yesterday"), "2025-01-14T00:00:00Z");
    EXPECT_EQ(parse_utc("  tomorrow "), "2025-01-16T00:00:00Z");
}

TEST(TimeParse, IsoForms) {
    EXPECT_EQ(parse_utc("2025-01-09"), "2025-01-09T00:00:00Z");
    EXPECT_EQ(parse_utc("2025-01-09T14:30:00Z"), "2025-01-09T14:30:00Z");
    EXPECT_EQ(parse_utc("2025-01-09 14:30"), "2025-01-09T14:30:00Z");
    EXPECT_EQ(parse_utc("2025-01-09T14:30:00+02:00"), "2025-01-09T12:30:00Z");
    EXPECT_EQ(parse_utc("2025-01-09T14:30:00-0530"), "2025-01-09T20:00:00Z");
}

TEST(TimeParse, FractionalSeconds) {
    TimePoint t = TimeTool::parse_time("2025-01-09T14:30:00.250Z", now_point());
    EXPECT_EQ(t.nanos, 250000000);
    EXPECT_EQ(TimeTool::format_time(t, "iso", "utc"), "2025-01-09T14:30:00Z");
}

TEST(TimeParse, WrittenDates) {
    EXPECT_EQ(parse_utc("January 9, 2025"), "2025-01-09T00:00:00Z");
    EXPECT_EQ(parse_utc("Jan 9 2025"), "2025-01-09T00:00:00Z");
    EXPECT_EQ(parse_utc("9 January 2025"), "2025-01-09T00:00:00Z");
    EXPECT_EQ(parse_utc("Sept 3, 2024"), "2024-09-03T00:00:00Z");
    EXPECT_EQ(parse_utc("March 1st, 2024"), "2024-03-01T00:00:00Z");
}

TEST(TimeParse, NextAndLastWeekday) {
    EXPECT_EQ(parse_utc("next friday"), "2025-01-17T00:00:00Z");
    EXPECT_EQ(parse_utc("next wednesday"), "2025-01-22T00:00:00Z");
    EXPECT_EQ(parse_utc("last monday"), "2025-01-13T00:00:00Z");
    EXPECT_EQ(parse_utc("last wed"), "2025-01-08T00:00:00Z");
}

TEST(TimeParse, NextAndLastUnit) {
    EXPECT_EQ(parse_utc("next week"), "2025-01-22T10:30:00Z");
    EXPECT_EQ(parse_utc("next month"), "2025-02-15T10:30:00Z");
    EXPECT_EQ(parse_utc("last year"), "2024-01-15T10:30:00Z");
}

TEST(TimeParse, AgoAndIn) {
    EXPECT_EQ(parse_utc("2 days ago"), "2025-01-13T10:30:00Z");
    EXPECT_EQ(parse_utc("an hour ago"), "2025-01-15T09:30:00Z");
    EXPECT_EQ(parse_utc("in 3 hours"), "2025-01-15T13:30:00Z");
    EXPECT_EQ(parse_utc("in 90 mins"), "2025-01-15T12:00:00Z");
    EXPECT_EQ(parse_utc("in a week"), "2025-01-22T10:30:00Z");
}

TEST(TimeParse, Errors) {
    std::string early = parse_error("0999-01-01");
    EXPECT_EQ(early.rfind("failed to parse timestamp: year 999 is before 1000", 0), 0u);
    EXPECT_NE(early.find("dates before year 1000 are not supported"), std::string::npos);

    EXPECT_EQ(parse_error("2025-02-30").rfind("failed to parse timestamp: field out of range in \"2025-02-30\"", 0), 0u);
    EXPECT_EQ(parse_error("2025-01-09T25:00").rfind("failed to parse timestamp: field out of range", 0), 0u);

    std::string junk = parse_error("the day after the party");
    EXPECT_EQ(junk.rfind("failed to parse timestamp: unrecognized date/time \"the day after the party\"", 0), 0u);
    EXPECT_NE(junk.find("Hint: Try using a more standard date format"), std::string::npos);

    EXPECT_FALSE(parse_error("next blursday").empty());
    EXPECT_FALSE(parse_error("3 fortnights ago").empty());
}

TEST(TimeParse, RelativeAmountLimits) {
    std::string huge = parse_error("99999999999999 weeks ago");
    EXPECT_EQ(huge.rfind("failed to parse timestamp: relative amount 99999999999999 is too large", 0), 0u);
    EXPECT_NE(huge.find("Hint: Try using a more standard date format"), std::string::npos);

    EXPECT_FALSE(parse_error("in 99999999999999999999999 days").empty());
    EXPECT_FALSE(parse_error("in 3000000000 months").empty());
    EXPECT_FALSE(parse_error("1000001 years ago").empty());

    EXPECT_EQ(parse_utc("in 0003 days"), "2025-01-18T10:30:00Z");
    EXPECT_EQ(parse_utc("1000000 seconds ago"), "2025-01-03T20:43:20Z");
}

TEST(TimeParse, LeapDay) {
    EXPECT_EQ(parse_utc("2024-02-29"), "2024-02-29T00:00:00Z");
    EXPECT_FALSE(parse_error("2023-02-29").empty());
}

// ---- Offsets ----

TEST(TimeOffset, Units) {
    constexpr int64_t s = 1000000000;
    EXPECT_EQ(TimeTool::parse_offset("0"), 0);
    EXPECT_EQ(TimeTool::parse_offset("90s"), 90 * s);
    EXPECT_EQ(TimeTool::parse_offset("1h30m"), 5400 * s);
    EXPECT_EQ(TimeTool::parse_offset("1.5h"), 5400 * s);
    EXPECT_EQ(TimeTool::parse_offset("-2d"), -2 * 86400 * s);
    EXPECT_EQ(TimeTool::parse_offset("+1w"), 604800 * s);
    EXPECT_EQ(TimeTool::parse_offset("250ms"), 250000000);
    EXPECT_EQ(TimeTool::parse_offset("3us"), 3000);
    EXPECT_EQ(TimeTool::parse_offset("3\xC2\xB5s"), 3000);
    EXPECT_EQ(TimeTool::parse_offset("7ns"), 7);
}

TEST(TimeOffset, Malformed) {
    EXPECT_FALSE(TimeTool::parse_offset("").has_value());
    EXPECT_FALSE(TimeTool::parse_offset("5").has_value());
    EXPECT_FALSE(TimeTool::parse_offset("h").has_value());
    EXPECT_FALSE(TimeTool::parse_offset("3 days").has_value());
    EXPECT_FALSE(TimeTool::parse_offset("2y").has_value());
    EXPECT_FALSE(TimeTool::parse_offset("99999999999999999999h").has_value());
}

// ---- Timezones ----

TEST(TimeZone, Validity) {
    EXPECT_TRUE(TimeTool::is_valid_timezone("utc"));
    EXPECT_TRUE(TimeTool::is_valid_timezone("UTC"));
    EXPECT_TRUE(TimeTool::is_valid_timezone("local"));
    EXPECT_FALSE(TimeTool::is_valid_timezone(""));
    EXPECT_FALSE(TimeTool::is_valid_timezone("Mars/Olympus_Mons"));
    EXPECT_FALSE(TimeTool::is_valid_timezone("/etc/passwd"));
    EXPECT_FALSE(TimeTool::is_valid_timezone("../../etc/passwd"));
}

// ---- Tool ----

TEST_F(TimeToolTest, DefaultsToNow) {
    EXPECT_EQ(run({{"timezone", "utc"}}), "2025-01-15T10:30:00Z");
    EXPECT_EQ(run({{"format", "unix"}}), "1736937000");
}

TEST_F(TimeToolTest, InputAndOffset) {
    EXPECT_EQ(run({{"input", "2025-01-09"}, {"offset", "36h"}, {"timezone", "utc"}}),
              "2025-01-10T12:00:00Z");
    EXPECT_EQ(run({{"offset", "-30m"}, {"timezone", "utc"}, {"format", "time"}}), "10:00:00");
}

TEST_F(TimeToolTest, SubSecondOffsetsCarry) {
    EXPECT_EQ(run({{"input", "2025-01-09T14:30:00.750Z"}, {"offset", "500ms"},
                   {"timezone", "utc"}, {"format", "time"}}),
              "14:30:01");
}

TEST_F(TimeToolTest, EmptyStringsUseDefaults) {
    EXPECT_EQ(run({{"input", ""}, {"offset", ""}, {"format", "unix"}}), "1736937000");
}

TEST_F(TimeToolTest, Errors) {
    try {
        (void)tool_.execute({{"timezone", "Mars/Olympus_Mons"}});
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_STREQ(e.what(), "invalid timezone: Mars/Olympus_Mons");
    }
    try {
        (void)tool_.execute({{"offset", "soon"}, {"timezone", "utc"}});
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_STREQ(e.what(), "invalid offset format: soon");
    }
    EXPECT_THROW((void)tool_.execute({{"input", "whenever"}}), ExecutionError);
}

TEST_F(TimeToolTest, UnparsableInputReportedBeforeTimezone) {
    try {
        (void)tool_.execute({{"input", "whenever"}, {"timezone", "Nowhere/Land"}});
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("failed to parse timestamp", 0), 0u);
    }
}

TEST_F(TimeToolTest, Resources) {
    EXPECT_TRUE(tool_.has_resource("time://formats"));
    EXPECT_TRUE(tool_.has_resource("time://examples"));
}
