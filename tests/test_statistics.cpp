#include <gtest/gtest.h>
#include "sampling/statistics.hpp"

using namespace adabench;

// ─── Rounding ──────────────────────────────────────────────────

TEST(StatisticsTest, RoundZeroIsZero) {
    EXPECT_EQ(roundToSignificantDigits(0.0, 2), 0.0);
}

TEST(StatisticsTest, RoundKeepsSignificantDigits) {
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(123.45, 2), 120.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(0.012345, 2), 0.012);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(5.0, 2), 5.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(996.45, 2), 1000.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(1017.6755, 2), 1000.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(988.99, 2), 990.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(123.45, 4), 123.5);
}

TEST(StatisticsTest, RoundExactHalvesToEven) {
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(12500.0, 2), 12000.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(13500.0, 2), 14000.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(8250.0, 2), 8200.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(0.125, 2), 0.12);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(0.375, 2), 0.38);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(2.5, 1), 2.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(-12500.0, 2), -12000.0);
}

TEST(StatisticsTest, RoundNegativeIsSymmetric) {
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(-123.45, 2), -120.0);
    EXPECT_DOUBLE_EQ(roundToSignificantDigits(-0.012345, 2), -0.012);
}

// ─── Descriptive statistics ────────────────────────────────────

TEST(StatisticsTest, MeanAndStdDev) {
    std::vector<double> v = {1, 2, 3, 4, 5};
    EXPECT_DOUBLE_EQ(mean(v), 3.0);
    EXPECT_NEAR(sampleStdDev(v), 1.5811388, 1e-6);
    EXPECT_EQ(sampleStdDev({4.0}), 0.0);
}

TEST(StatisticsTest, AllIdenticalIsBitwise) {
    EXPECT_TRUE(allIdentical({5.0, 5.0, 5.0}));
    EXPECT_TRUE(allIdentical({}));
    EXPECT_FALSE(allIdentical({5.0, 5.0, 5.0000000001}));
    EXPECT_FALSE(allIdentical({0.0, -0.0}));
}

// ─── Confidence intervals ──────────────────────────────────────

TEST(StatisticsTest, StudentTInterval) {
    ConfidenceInterval ci = tConfidenceInterval({1, 2, 3, 4, 5}, 0.05);
    EXPECT_NEAR(ci.low, 1.0367568, 1e-6);
    EXPECT_NEAR(ci.high, 4.9632432, 1e-6);

    ConfidenceInterval small = tConfidenceInterval({1000, 1010, 1000}, 0.05);
    EXPECT_NEAR(small.low, 988.99116, 1e-4);
    EXPECT_NEAR(small.high, 1017.67551, 1e-4);
}

TEST(StatisticsTest, LowerSignificanceWidensInterval) {
    std::vector<double> v = {10, 12, 11, 13, 9};
    EXPECT_GT(tConfidenceInterval(v, 0.01).width(), tConfidenceInterval(v, 0.05).width());
}

TEST(StatisticsTest, ConstantSeriesIsDegenerate) {
    ConfidenceInterval ci = tConfidenceInterval({5.0, 5.0, 5.0}, 0.05);
    EXPECT_EQ(ci.low, 5.0);
    EXPECT_EQ(ci.high, 5.0);

    ConfidenceInterval single = tConfidenceInterval({7.5}, 0.05);
    EXPECT_EQ(single.low, 7.5);
    EXPECT_EQ(single.high, 7.5);
}

TEST(StatisticsTest, RoundInterval) {
    ConfidenceInterval ci = roundInterval({996.4471, 1007.5529}, 2);
    EXPECT_DOUBLE_EQ(ci.low, 1000.0);
    EXPECT_DOUBLE_EQ(ci.high, 1000.0);
}
