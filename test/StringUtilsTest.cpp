#include <gtest/gtest.h>
#include "StringUtils.h"

TEST(StringUtilsTest, SafeCopyTruncatesAndTerminates) {
    char buffer[6];
    StringUtils::safeCopyString(buffer, "192.168.1.50", sizeof(buffer));
    EXPECT_STREQ("192.1", buffer);

    StringUtils::safeCopyString(buffer, "ok", sizeof(buffer));
    EXPECT_STREQ("ok", buffer);
}

TEST(StringUtilsTest, FormatUptime) {
    char buffer[32];
    EXPECT_STREQ("0m 00s", StringUtils::formatUptime(buffer, sizeof(buffer), 0));
    EXPECT_STREQ("3m 04s", StringUtils::formatUptime(buffer, sizeof(buffer), 184));
    EXPECT_STREQ("2h 03m 04s", StringUtils::formatUptime(buffer, sizeof(buffer), 7384));
    EXPECT_STREQ("1d 02h 03m 04s", StringUtils::formatUptime(buffer, sizeof(buffer), 93784));
}
