#include <gtest/gtest.h>

#include "utils/logging.hpp"

namespace {

using namespace rampart::utils;

TEST(LoggingTest, FormatsTagLevelAndSortedFields) {
    const LogMessage msg{LogLevel::kWarn, "tool", "slow call", {{"ms", "900"}, {"name", "grep"}}};
    EXPECT_EQ(FormatLogLine(msg), "[tool] WARN slow call ms=900 name=grep");
}

TEST(LoggingTest, ParsesLevelsCaseInsensitively) {
    EXPECT_EQ(ParseLogLevel("DEBUG", LogLevel::kInfo), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("warning", LogLevel::kInfo), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("Error", LogLevel::kInfo), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("loud", LogLevel::kInfo), LogLevel::kInfo);
}

}  // namespace
