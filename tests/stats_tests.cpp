#include <gtest/gtest.h>
#include "macrosim/stats.hpp"

using macrosim::Vec;

// floor(0.1 * 10) = 1 value dropped from each tail
TEST(StatsTest, TrimmedMeanDropsOneFromEachTail) {
    Vec v{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    EXPECT_DOUBLE_EQ(macrosim::trimmed_mean(v, 0.1), 5.5);
}

TEST(StatsTest, TrimmedMeanSortsByValue) {
    Vec v{10, 3, 1, 8, 5, 2, 9, 4, 7, 6};
    EXPECT_DOUBLE_EQ(macrosim::trimmed_mean(v, 0.1), 5.5);
}

TEST(StatsTest, TrimmedMeanIgnoresOutliers) {
    Vec v;
    for (int i = 1; i <= 19; ++i) v.push_back(i);
    v.push_back(1000.0);

    // drops {1, 2} and {19, 1000}
    EXPECT_DOUBLE_EQ(macrosim::trimmed_mean(v, 0.1), 10.5);
}

TEST(StatsTest, SmallSampleKeepsEverything) {
    Vec v{1, 2, 3, 4, 100};
    EXPECT_DOUBLE_EQ(macrosim::trimmed_mean(v, 0.1), 22.0);
    EXPECT_DOUBLE_EQ(macrosim::trimmed_mean({7.0}, 0.1), 7.0);
}

TEST(StatsTest, ZeroProportionIsPlainMean) {
    Vec v{4, 1, 1};
    EXPECT_DOUBLE_EQ(macrosim::trimmed_mean(v, 0.0), 2.0);
    EXPECT_DOUBLE_EQ(macrosim::mean(v), 2.0);
}

TEST(StatsTest, TiesAreTrimmedByValue) {
    Vec v{5, 5, 5, 5, 5, 5, 5, 5, 5, 0};
    // the single 0 and one of the 5s go
    EXPECT_DOUBLE_EQ(macrosim::trimmed_mean(v, 0.1), 5.0);
}

TEST(StatsDeathTest, EmptyInputIsFatal) {
    EXPECT_EXIT(macrosim::trimmed_mean(Vec{}, 0.1), ::testing::ExitedWithCode(1), "trimmed_mean: empty input");
    EXPECT_EXIT(macrosim::mean(Vec{}), ::testing::ExitedWithCode(1), "mean: empty input");
}

TEST(StatsDeathTest, ProportionOutOfRangeIsFatal) {
    EXPECT_EXIT(macrosim::trimmed_mean(Vec{1, 2, 3}, 0.5), ::testing::ExitedWithCode(1), "prop must be in");
    EXPECT_EXIT(macrosim::trimmed_mean(Vec{1, 2, 3}, -0.1), ::testing::ExitedWithCode(1), "prop must be in");
}
