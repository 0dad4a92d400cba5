#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

using namespace std;

TEST(UtilsTest, FormatScore) {
    EXPECT_EQ(format_score(18.0), "18");
    EXPECT_EQ(format_score(0.5), "0.5");
    EXPECT_EQ(format_score(3.33), "3.33");
    EXPECT_EQ(format_score(0.0), "0");
    EXPECT_EQ(format_score(-0.0), "0");
}

TEST(UtilsTest, RoundTo) {
    EXPECT_DOUBLE_EQ(round_to(3.3333, 2), 3.33);
    EXPECT_DOUBLE_EQ(round_to(2.675, 0), 3);
    EXPECT_DOUBLE_EQ(round_to(12.5, 0), 13);
    EXPECT_DOUBLE_EQ(round_to(0.125, 1), 0.1);
}

TEST(UtilsTest, AssertSafePath) {
    EXPECT_EQ(scoring::assert_safe_path("zh_CN"), "zh_CN");
    EXPECT_THROW(scoring::assert_safe_path("../etc"), scoring::configuration_error);
    EXPECT_THROW(scoring::assert_safe_path(".."), scoring::configuration_error);
    EXPECT_THROW(scoring::assert_safe_path(""), scoring::configuration_error);
}
