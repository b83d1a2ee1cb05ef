/**
 * @file test_time_window_filter.cpp
 * @brief Unit tests for partition parsing and time window filtering
 */

#include <gtest/gtest.h>

#include <azblob/storage/storage_utils.h>
#include <azblob/storage/time_window_filter.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace azblob::test {

using storage_utils::make_utc_time;

namespace {

constexpr const char* prefix =
    "https://acct.blob.core.windows.net/insights-logs-appserviceconsolelogs/"
    "resourceId=/SUBSCRIPTIONS/0000/RESOURCEGROUPS/RG/PROVIDERS/MICROSOFT.WEB/SITES/APP/";

auto hierarchical_url(int hour, const std::string& day = "15") -> std::string {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "y=2024/m=03/d=%s/h=%02d/m=00/PT1H.json", day.c_str(), hour);
    return std::string(prefix) + buf + "?sv=2023-11-03&sig=abc";
}

}  // namespace

// =============================================================================
// Partition Parsing Tests
// =============================================================================

class ParseBlobPartitionTest : public ::testing::Test {};

TEST_F(ParseBlobPartitionTest, HierarchicalWithMinute) {
    auto descriptor = parse_blob_partition(std::string(prefix) +
                                           "y=2024/m=03/d=15/h=09/m=30/PT1H.json?sig=x");

    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(descriptor->scheme, partition_scheme::hierarchical);
    EXPECT_EQ(descriptor->year, 2024);
    EXPECT_EQ(descriptor->month, 3);
    EXPECT_EQ(descriptor->day, 15);
    EXPECT_EQ(descriptor->hour, 9);
    EXPECT_EQ(descriptor->minute, 30);
    EXPECT_EQ(descriptor->hour_start(), make_utc_time(2024, 3, 15, 9));
    EXPECT_EQ(descriptor->hour_end(), make_utc_time(2024, 3, 15, 9, 59, 59));
    EXPECT_EQ(descriptor->name.find("sig="), std::string::npos);
}

TEST_F(ParseBlobPartitionTest, HierarchicalWithoutMinute) {
    auto descriptor = parse_blob_partition("y=2023/m=12/d=31/h=23/log.json");

    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(descriptor->month, 12);
    EXPECT_EQ(descriptor->hour, 23);
    EXPECT_FALSE(descriptor->minute.has_value());
}

TEST_F(ParseBlobPartitionTest, MonthIsFirstMAfterYear) {
    // An m= segment before y= is not part of the date
    auto descriptor = parse_blob_partition("m=07/y=2024/m=02/d=29/h=00/m=45/PT1H.json");

    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(descriptor->month, 2);
    EXPECT_EQ(descriptor->day, 29);
    EXPECT_EQ(descriptor->minute, 45);
}

TEST_F(ParseBlobPartitionTest, LegacyLayout) {
    auto descriptor = parse_blob_partition(
        "https://acct.blob.core.windows.net/logs/2024/03/15/09/applog.txt?sig=x");

    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(descriptor->scheme, partition_scheme::legacy);
    EXPECT_EQ(descriptor->year, 2024);
    EXPECT_EQ(descriptor->month, 3);
    EXPECT_EQ(descriptor->day, 15);
    EXPECT_EQ(descriptor->hour, 9);
    EXPECT_FALSE(descriptor->minute.has_value());
}

TEST_F(ParseBlobPartitionTest, LegacyLayoutAtStartOfRelativeName) {
    auto descriptor = parse_blob_partition("2024/03/15/09/applog.txt");

    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(descriptor->scheme, partition_scheme::legacy);
}

TEST_F(ParseBlobPartitionTest, UnrecognizedLayouts) {
    EXPECT_FALSE(parse_blob_partition("https://acct.blob.core.windows.net/logs/readme.txt").has_value());
    EXPECT_FALSE(parse_blob_partition("y=2024/d=15/h=09/x.json").has_value());
    EXPECT_FALSE(parse_blob_partition("logs/2024/3/15/09/x.json").has_value());
}

TEST_F(ParseBlobPartitionTest, OutOfRangeFieldsAreRejected) {
    EXPECT_FALSE(parse_blob_partition("y=2024/m=03/d=15/h=24/PT1H.json").has_value());
    EXPECT_FALSE(parse_blob_partition("y=2024/m=13/d=15/h=09/PT1H.json").has_value());
    EXPECT_FALSE(parse_blob_partition("y=2023/m=02/d=29/h=09/PT1H.json").has_value());
    EXPECT_FALSE(parse_blob_partition("y=2024/m=ab/d=15/h=09/PT1H.json").has_value());
    EXPECT_FALSE(parse_blob_partition("logs/2024/03/15/25/x.json").has_value());
}

TEST_F(ParseBlobPartitionTest, InvalidHierarchicalDoesNotFallBackToLegacy) {
    EXPECT_FALSE(parse_blob_partition("2024/03/15/09/y=2024/m=03/d=15/h=99/x.json").has_value());
}

// =============================================================================
// Timestamp Parsing Tests
// =============================================================================

class ParseUtcTimestampTest : public ::testing::Test {};

TEST_F(ParseUtcTimestampTest, ZuluTime) {
    auto tp = parse_utc_timestamp("2024-03-15T09:30:00Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(tp.value(), make_utc_time(2024, 3, 15, 9, 30));
}

TEST_F(ParseUtcTimestampTest, NoZoneMeansUtc) {
    auto tp = parse_utc_timestamp("2024-03-15T09:30:00");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(tp.value(), make_utc_time(2024, 3, 15, 9, 30));
}

TEST_F(ParseUtcTimestampTest, DateOnlyMeansMidnight) {
    auto tp = parse_utc_timestamp("2024-03-15");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(tp.value(), make_utc_time(2024, 3, 15));
}

TEST_F(ParseUtcTimestampTest, OffsetsAreNormalizedToUtc) {
    auto plus = parse_utc_timestamp("2024-03-15T09:00:00+02:00");
    ASSERT_TRUE(plus.has_value());
    EXPECT_EQ(plus.value(), make_utc_time(2024, 3, 15, 7));

    auto minus = parse_utc_timestamp("2024-03-15T09:00:00-0530");
    ASSERT_TRUE(minus.has_value());
    EXPECT_EQ(minus.value(), make_utc_time(2024, 3, 15, 14, 30));
}

TEST_F(ParseUtcTimestampTest, SpaceSeparatorAndFraction) {
    auto tp = parse_utc_timestamp("2024-03-15 09:00:00.250Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(tp.value(), make_utc_time(2024, 3, 15, 9) + std::chrono::milliseconds(250));
}

TEST_F(ParseUtcTimestampTest, MinutePrecision) {
    auto tp = parse_utc_timestamp("2024-03-15T09:45");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(tp.value(), make_utc_time(2024, 3, 15, 9, 45));
}

TEST_F(ParseUtcTimestampTest, InvalidInputs) {
    for (const char* text : {"", "yesterday", "2024-3-15", "2024-03-15T9:00", "2024-02-30",
                             "2024-03-15T09:00:00Q", "2024-03-15T25:00:00Z",
                             "2024-03-15T09:00:00+2"}) {
        auto tp = parse_utc_timestamp(text);
        ASSERT_FALSE(tp.has_value()) << text;
        EXPECT_EQ(tp.error().code, error_code::invalid_argument);
    }
}

// =============================================================================
// Time Window Tests
// =============================================================================

class TimeWindowTest : public ::testing::Test {};

TEST_F(TimeWindowTest, MinutesBackResolvesAgainstNow) {
    auto now = make_utc_time(2024, 3, 15, 10, 30);
    auto range = time_window::last_minutes(60).resolve(now);

    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first, make_utc_time(2024, 3, 15, 9, 30));
    EXPECT_EQ(range->second, now);
}

TEST_F(TimeWindowTest, MinutesBackWinsOverExplicitRange) {
    auto window = time_window::between(make_utc_time(2020, 1, 1), make_utc_time(2020, 1, 2));
    window.minutes_back = 10;

    auto now = make_utc_time(2024, 3, 15, 10);
    auto range = window.resolve(now);

    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first, make_utc_time(2024, 3, 15, 9, 50));
}

TEST_F(TimeWindowTest, IncompleteWindowsDisableFiltering) {
    time_window empty;
    EXPECT_FALSE(empty.resolve(make_utc_time(2024, 3, 15)).has_value());

    time_window only_start;
    only_start.start = make_utc_time(2024, 3, 15);
    EXPECT_FALSE(only_start.resolve(make_utc_time(2024, 3, 15)).has_value());

    EXPECT_FALSE(time_window::last_minutes(0).resolve(make_utc_time(2024, 3, 15)).has_value());
}

TEST_F(TimeWindowTest, FromStrings) {
    auto window = time_window::from_strings("2024-03-15T09:00:00Z", "2024-03-15T10:00:00Z");

    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window.value().start, make_utc_time(2024, 3, 15, 9));
    EXPECT_EQ(window.value().end, make_utc_time(2024, 3, 15, 10));
}

TEST_F(TimeWindowTest, FromStringsRejectsReversedOrInvalid) {
    auto reversed = time_window::from_strings("2024-03-15T10:00:00Z", "2024-03-15T09:00:00Z");
    ASSERT_FALSE(reversed.has_value());
    EXPECT_EQ(reversed.error().code, error_code::invalid_argument);

    EXPECT_FALSE(time_window::from_strings("bad", "2024-03-15").has_value());
}

// =============================================================================
// Filter Tests
// =============================================================================

class TimeWindowFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = std::make_shared<storage_logger>();
        logger_->set_level(log_level::trace);
        logger_->set_callback([this](log_level level, std::string_view, std::string_view message,
                                     const blob_log_context*) {
            log_.emplace_back(level, std::string(message));
        });
    }

    auto count_level(log_level level) const -> int {
        int count = 0;
        for (const auto& entry : log_) {
            if (entry.first == level) ++count;
        }
        return count;
    }

    std::shared_ptr<storage_logger> logger_;
    std::vector<std::pair<log_level, std::string>> log_;
};

TEST_F(TimeWindowFilterTest, HourInsideWindowIsIncluded) {
    std::vector<std::string> urls{std::string(prefix) + "y=2024/m=03/d=15/h=09/m=30/PT1H.json"};
    auto window = time_window::between(make_utc_time(2024, 3, 15, 9),
                                       make_utc_time(2024, 3, 15, 9, 59, 59));

    auto selected = time_window_filter({}, logger_).filter_blobs_by_date(urls, window);

    EXPECT_EQ(selected, urls);
}

TEST_F(TimeWindowFilterTest, HourBeforeWindowIsExcluded) {
    std::vector<std::string> urls{std::string(prefix) + "y=2024/m=03/d=15/h=09/m=30/PT1H.json"};
    auto window = time_window::between(make_utc_time(2024, 3, 15, 10),
                                       make_utc_time(2024, 3, 15, 11));

    auto selected = time_window_filter({}, logger_).filter_blobs_by_date(urls, window);

    EXPECT_TRUE(selected.empty());
}

TEST_F(TimeWindowFilterTest, PartialOverlapAtBothEdges) {
    std::vector<std::string> urls;
    for (int hour = 6; hour <= 12; ++hour) {
        urls.push_back(hierarchical_url(hour));
    }
    auto window = time_window::between(make_utc_time(2024, 3, 15, 8, 45),
                                       make_utc_time(2024, 3, 15, 10, 15));

    auto selected = time_window_filter({}, logger_).filter_blobs_by_date(urls, window);

    EXPECT_EQ(selected, (std::vector<std::string>{hierarchical_url(8), hierarchical_url(9),
                                                  hierarchical_url(10)}));
}

TEST_F(TimeWindowFilterTest, LegacyPathsFilterTheSameWay) {
    std::vector<std::string> urls{
        "https://acct.blob.core.windows.net/logs/2024/03/15/08/a.log",
        "https://acct.blob.core.windows.net/logs/2024/03/15/09/a.log",
        "https://acct.blob.core.windows.net/logs/2024/03/15/10/a.log",
    };
    auto window = time_window::between(make_utc_time(2024, 3, 15, 9),
                                       make_utc_time(2024, 3, 15, 9, 59, 59));

    auto selected = time_window_filter({}, logger_).filter_blobs_by_date(urls, window);

    EXPECT_EQ(selected, (std::vector<std::string>{urls[1]}));
}

TEST_F(TimeWindowFilterTest, LegacyAndHierarchicalAgree) {
    const std::string legacy = "https://acct.blob.core.windows.net/logs/2024/03/15/09/file.json";
    const std::string hierarchical = hierarchical_url(9);
    time_window_filter filter({}, logger_);

    for (const auto& window : {
             time_window::between(make_utc_time(2024, 3, 15, 9),
                                  make_utc_time(2024, 3, 15, 9, 59, 59)),
             time_window::between(make_utc_time(2024, 3, 15, 10),
                                  make_utc_time(2024, 3, 15, 11)),
             time_window::between(make_utc_time(2024, 3, 15, 8),
                                  make_utc_time(2024, 3, 15, 8, 59, 59)),
         }) {
        EXPECT_EQ(filter.filter_blobs_by_date({legacy}, window).size(),
                  filter.filter_blobs_by_date({hierarchical}, window).size());
    }
}

TEST_F(TimeWindowFilterTest, UnparseableBlobsAreKept) {
    std::vector<std::string> urls{
        "https://acct.blob.core.windows.net/logs/readme.txt",
        hierarchical_url(3),
        std::string(prefix) + "y=2024/m=03/d=15/h=24/PT1H.json",
    };
    auto window = time_window::between(make_utc_time(2024, 3, 15, 9),
                                       make_utc_time(2024, 3, 15, 10));

    auto selected = time_window_filter({}, logger_).filter_blobs_by_date(urls, window);

    EXPECT_EQ(selected, (std::vector<std::string>{urls[0], urls[2]}));
    EXPECT_EQ(count_level(log_level::warn), 1);
}

TEST_F(TimeWindowFilterTest, MinutesBackUsesInjectedNow) {
    std::vector<std::string> urls{hierarchical_url(7), hierarchical_url(8), hierarchical_url(9)};
    auto now = make_utc_time(2024, 3, 15, 9, 20);

    auto selected = time_window_filter({}, logger_)
                        .filter_blobs_by_date(urls, time_window::last_minutes(60), now);

    EXPECT_EQ(selected, (std::vector<std::string>{hierarchical_url(8), hierarchical_url(9)}));
}

TEST_F(TimeWindowFilterTest, NoWindowReturnsInputUnchanged) {
    std::vector<std::string> urls{hierarchical_url(1), "unparseable", hierarchical_url(2)};

    time_window only_end;
    only_end.end = make_utc_time(2024, 3, 15);

    EXPECT_EQ(time_window_filter({}, logger_).filter_blobs_by_date(urls, only_end), urls);
    EXPECT_EQ(time_window_filter({}, logger_).filter_blobs_by_date(urls, time_window{}), urls);
}

TEST_F(TimeWindowFilterTest, PreservesInputOrder) {
    std::vector<std::string> urls{hierarchical_url(10), hierarchical_url(9, "14"),
                                  hierarchical_url(9)};
    auto window = time_window::between(make_utc_time(2024, 3, 14), make_utc_time(2024, 3, 16));

    EXPECT_EQ(time_window_filter({}, logger_).filter_blobs_by_date(urls, window), urls);
}

TEST_F(TimeWindowFilterTest, DecisionsLoggedOnlyInDebug) {
    std::vector<std::string> urls{hierarchical_url(9), hierarchical_url(12)};
    auto window = time_window::between(make_utc_time(2024, 3, 15, 9),
                                       make_utc_time(2024, 3, 15, 10));

    auto quiet = time_window_filter({}, logger_).filter_blobs_by_date(urls, window);
    EXPECT_EQ(count_level(log_level::debug), 0);

    filter_options options;
    options.debug = true;
    auto verbose = time_window_filter(options, logger_).filter_blobs_by_date(urls, window);
    EXPECT_EQ(count_level(log_level::debug), 2);
    EXPECT_EQ(quiet, verbose);
}

TEST_F(TimeWindowFilterTest, ArchivesExcludedOnlyWhenRequested) {
    std::vector<std::string> urls{
        "https://acct.blob.core.windows.net/logs/export.zip",
        "https://acct.blob.core.windows.net/logs/2024/03/15/09/a.log.gz",
        hierarchical_url(9),
    };
    auto window = time_window::between(make_utc_time(2024, 3, 15, 9),
                                       make_utc_time(2024, 3, 15, 10));

    EXPECT_EQ(time_window_filter({}, logger_).filter_blobs_by_date(urls, window), urls);

    filter_options options;
    options.exclude_archives = true;
    EXPECT_EQ(time_window_filter(options, logger_).filter_blobs_by_date(urls, window),
              (std::vector<std::string>{urls[2]}));
}

TEST_F(TimeWindowFilterTest, FreeFunctionFilters) {
    std::vector<std::string> urls{hierarchical_url(9), hierarchical_url(15)};
    auto window = time_window::between(make_utc_time(2024, 3, 15, 9),
                                       make_utc_time(2024, 3, 15, 10));

    EXPECT_EQ(filter_blobs_by_date(urls, window), (std::vector<std::string>{urls[0]}));
}

}  // namespace azblob::test
