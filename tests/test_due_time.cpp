#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <ctime>
#include <limits>

#include "Task/TaskRecord.hpp"

using namespace tsched;

namespace {

// TZ процесса на время теста
class ScopedTimeZone {
public:
    explicit ScopedTimeZone(const char* tz) {
        if (const char* old = std::getenv("TZ")) { had_ = true; old_ = old; }
        setenv("TZ", tz, 1);
        tzset();
    }
    ~ScopedTimeZone() {
        if (had_) setenv("TZ", old_.c_str(), 1);
        else unsetenv("TZ");
        tzset();
    }

private:
    bool        had_{false};
    std::string old_;
};

} // namespace

TEST(DueTime, AbsoluteEpochIsTakenAsIs) {
    EXPECT_DOUBLE_EQ(resolveDueTime(at(1800000000.5), 1700000000.0), 1800000000.5);
}

TEST(DueTime, OffsetIsRelativeToNow) {
    EXPECT_DOUBLE_EQ(resolveDueTime(in(std::chrono::seconds(90)), 1700000000.0), 1700000090.0);
    EXPECT_DOUBLE_EQ(resolveDueTime(in(std::chrono::milliseconds(-2500)), 1700000000.0), 1699999997.5);
}

TEST(DueTime, IsoTimestampVariants) {
    // 2024-01-01T00:00:00Z == 1704067200
    EXPECT_DOUBLE_EQ(parseIsoTimestamp("2024-01-01T00:00:00Z"), 1704067200.0);
    EXPECT_DOUBLE_EQ(parseIsoTimestamp("2024-01-01T00:00:00.250Z"), 1704067200.25);
    EXPECT_DOUBLE_EQ(parseIsoTimestamp("2024-01-01T02:00:00+02:00"), 1704067200.0);
    EXPECT_DOUBLE_EQ(parseIsoTimestamp("2023-12-31T19:30:00-0430"), 1704067200.0);
}

TEST(DueTime, TimestampWithoutZoneIsLocalTime) {
    {
        ScopedTimeZone tz("EET-2");   // UTC+2 без перехода на летнее время
        EXPECT_DOUBLE_EQ(parseIsoTimestamp("2024-01-01T02:00:00"), 1704067200.0);
        EXPECT_DOUBLE_EQ(parseIsoTimestamp("2024-01-01 02:00:00.250"), 1704067200.25);
        // явная зона не зависит от TZ
        EXPECT_DOUBLE_EQ(parseIsoTimestamp("2024-01-01T00:00:00Z"), 1704067200.0);
    }
    {
        ScopedTimeZone tz("XYZ+5");   // UTC-5
        EXPECT_DOUBLE_EQ(parseIsoTimestamp("2024-01-01"), 1704067200.0 + 5 * 3600);
    }
    {
        ScopedTimeZone tz("UTC0");
        EXPECT_DOUBLE_EQ(parseIsoTimestamp("2024-01-01T00:00:00"), 1704067200.0);
    }
}

TEST(DueTime, FarFutureIsRejected) {
    EXPECT_NO_THROW(resolveDueTime(at(kMaxEpochSeconds), 1.0));
    EXPECT_THROW(resolveDueTime(at(kMaxEpochSeconds + 1), 1.0), ValidationError);
    EXPECT_THROW(resolveDueTime(at(4e11), 1.0), ValidationError);
    EXPECT_THROW(resolveDueTime(at(1e300), 1.0), ValidationError);
    EXPECT_THROW(resolveDueTime(in(std::chrono::duration<double>(1e13)), 1700000000.0), ValidationError);
    EXPECT_THROW(resolveDueTime(iso("9999-12-31T23:00:00-05:00"), 1.0), ValidationError);
}

TEST(DueTime, FormattingNeverThrows) {
    EXPECT_EQ(formatIsoTimestamp(kMaxEpochSeconds), "9999-12-31T23:59:59Z");
    EXPECT_EQ(formatIsoTimestamp(4e11), "invalid");
    EXPECT_EQ(formatIsoTimestamp(1e20), "invalid");
    EXPECT_EQ(formatIsoTimestamp(-1.0), "invalid");
    EXPECT_EQ(formatIsoTimestamp(std::numeric_limits<double>::infinity()), "invalid");
}

TEST(DueTime, FormatsAsUtcIso) {
    EXPECT_EQ(formatIsoTimestamp(1704067200.0), "2024-01-01T00:00:00Z");
    EXPECT_EQ(formatIsoTimestamp(1704067200.5), "2024-01-01T00:00:00.500000Z");
}

TEST(DueTime, UnresolvableSpecIsValidationError) {
    EXPECT_THROW(resolveDueTime(iso("tomorrow-ish"), 1.0), ValidationError);
    EXPECT_THROW(resolveDueTime(iso("2024-13-45T00:00:00"), 1.0), ValidationError);
    EXPECT_THROW(resolveDueTime(iso("2024-01-01T00:00:00+99:00"), 1.0), ValidationError);
    EXPECT_THROW(resolveDueTime(at(std::numeric_limits<double>::quiet_NaN()), 1.0), ValidationError);
    EXPECT_THROW(resolveDueTime(at(0), 1.0), ValidationError);
    EXPECT_THROW(resolveDueTime(at(-5), 1.0), ValidationError);
}

TEST(DueTime, RecurrenceNeedsPositiveInterval) {
    EXPECT_NO_THROW(validateRecurrence(false, std::nullopt));
    EXPECT_NO_THROW(validateRecurrence(true, std::chrono::seconds(10)));
    EXPECT_THROW(validateRecurrence(true, std::nullopt), ValidationError);
    EXPECT_THROW(validateRecurrence(true, std::chrono::seconds(0)), ValidationError);
    EXPECT_THROW(validateRecurrence(true, std::chrono::seconds(-3)), ValidationError);
    EXPECT_NO_THROW(validateRecurrence(true, std::chrono::seconds(kMaxRecurrenceSeconds)));
    EXPECT_THROW(validateRecurrence(true, std::chrono::seconds(kMaxRecurrenceSeconds + 1)), ValidationError);
}

TEST(DueTime, PriorityMustFitInt) {
    EXPECT_EQ(checkedPriority(-7), -7);
    EXPECT_EQ(checkedPriority(std::numeric_limits<int>::max()), std::numeric_limits<int>::max());
    EXPECT_THROW(checkedPriority(4294967297LL), ValidationError);
    EXPECT_THROW(checkedPriority(-4294967297LL), ValidationError);
}

TEST(DueTime, SummaryAndSeriesRoot) {
    Payload p = json::Value::parse(R"({"agent":"ScraperAgent","action":"scrape"})");
    EXPECT_EQ(summarize(p), "ScraperAgent.scrape");
    EXPECT_EQ(summarize(json::Value::object()), "unknown.unknown");

    EXPECT_EQ(seriesRoot("report"), "report");
    EXPECT_EQ(seriesRoot("report_next_1700000000"), "report");
    EXPECT_EQ(seriesRoot("report_next_1700000000_next_1700000060"), "report");
}
