#include <gtest/gtest.h>
#include "../../src/taskfold/result_record.h"

#include <chrono>

using namespace Taskfold;

namespace {

ResultRecord MakeRecord() {
    ResultRecord record;
    record.timestamp = std::chrono::system_clock::from_time_t(1760000000) + std::chrono::microseconds(42);
    record.worker_id = 3;
    record.task_id = 17;
    record.payload = "data-17";
    return record;
}

} // namespace

TEST(ResultRecordTest, FormatsTimestampAsUtcMicroseconds) {
    auto tp = std::chrono::system_clock::from_time_t(0) + std::chrono::microseconds(123456);
    EXPECT_EQ(FormatTimestamp(tp), "1970-01-01T00:00:00.123456Z");
}

TEST(ResultRecordTest, FormatsOneNewlineTerminatedLine) {
    EXPECT_EQ(FormatResultLine(MakeRecord()),
              "[2025-10-09T08:53:20.000042Z] Worker-3 processed Task-17 payload='data-17'\n");
}

TEST(ResultRecordTest, ParsesFormattedLine) {
    ResultRecord original = MakeRecord();
    ResultRecord parsed;
    ASSERT_TRUE(ParseResultLine(FormatResultLine(original), &parsed));
    EXPECT_EQ(parsed.timestamp, original.timestamp);
    EXPECT_EQ(parsed.worker_id, 3);
    EXPECT_EQ(parsed.task_id, 17);
    EXPECT_EQ(parsed.payload, "data-17");
}

TEST(ResultRecordTest, PayloadMayContainQuotesAndSpaces) {
    ResultRecord record = MakeRecord();
    record.payload = "it's a test";
    ResultRecord parsed;
    ASSERT_TRUE(ParseResultLine(FormatResultLine(record), &parsed));
    EXPECT_EQ(parsed.payload, "it's a test");
}

TEST(ResultRecordTest, RejectsSplicedRecords) {
    std::string a = FormatResultLine(MakeRecord());
    ResultRecord other = MakeRecord();
    other.worker_id = 4;
    other.task_id = 18;
    std::string b = FormatResultLine(other);

    // Second record cut into the middle of the first
    std::string spliced = a.substr(0, 20) + b;
    EXPECT_FALSE(ParseResultLine(spliced, nullptr));

    // First record missing its newline, followed directly by the second
    std::string joined = a.substr(0, a.size() - 1) + b;
    EXPECT_FALSE(ParseResultLine(joined, nullptr));

    // Two complete lines in one buffer
    EXPECT_FALSE(ParseResultLine(a + b, nullptr));
}

TEST(ResultRecordTest, RejectsMalformedLines) {
    EXPECT_FALSE(ParseResultLine("", nullptr));
    EXPECT_FALSE(ParseResultLine("\n", nullptr));
    EXPECT_FALSE(ParseResultLine("[2025-10-09T08:53:20.000042Z] Worker-3 processed Task-17 payload='data-17\n", nullptr));
    EXPECT_FALSE(ParseResultLine("[2025-10-09 08:53:20] Worker-3 processed Task-17 payload='data-17'\n", nullptr));
    EXPECT_FALSE(ParseResultLine("[2025-10-09T08:53:20.000042Z] Worker-0 processed Task-17 payload='data-17'\n", nullptr));
    EXPECT_FALSE(ParseResultLine("[2025-10-09T08:53:20.000042Z] Worker-3 processed Task- payload='data-17'\n", nullptr));
    EXPECT_FALSE(ParseResultLine("[2025-10-09T08:53:20.000042Z] Worker-3 handled Task-17 payload='data-17'\n", nullptr));
}
