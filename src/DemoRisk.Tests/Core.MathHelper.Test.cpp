#include "pch.h"

#include "DemoRisk.Core/math_util.h"

#include <cmath>
#include <vector>

using namespace drisk::core;

TEST(TestCoreMathHelper, RoundToDecimals) {
    EXPECT_DOUBLE_EQ(0.333, MathHelper::round_to(1.0 / 3.0, 3));
    EXPECT_DOUBLE_EQ(0.667, MathHelper::round_to(2.0 / 3.0, 3));
    EXPECT_DOUBLE_EQ(2.0, MathHelper::round_to(2.5, 0));
    EXPECT_DOUBLE_EQ(4.0, MathHelper::round_to(3.5, 0));
    EXPECT_DOUBLE_EQ(-1.25, MathHelper::round_to(-1.25, 2));
    EXPECT_TRUE(std::isnan(MathHelper::round_to(std::nan(""), 2)));
    EXPECT_TRUE(std::isinf(MathHelper::round_to(HUGE_VAL, 3)));
}

TEST(TestCoreMathHelper, PercentileLinearInterpolation) {
    auto values = std::vector<double>{4.0, 1.0, 3.0, 2.0, 5.0};
    EXPECT_DOUBLE_EQ(1.0, MathHelper::percentile(values, 0.0));
    EXPECT_DOUBLE_EQ(3.0, MathHelper::percentile(values, 50.0));
    EXPECT_DOUBLE_EQ(5.0, MathHelper::percentile(values, 100.0));
    EXPECT_NEAR(4.6, MathHelper::percentile(values, 90.0), 1e-12);
    EXPECT_NEAR(1.4, MathHelper::percentile(values, 10.0), 1e-12);
}

TEST(TestCoreMathHelper, PercentileBoundaries) {
    auto values = std::vector<double>{10.0, 20.0};
    EXPECT_DOUBLE_EQ(10.0, MathHelper::percentile(values, -5.0));
    EXPECT_DOUBLE_EQ(20.0, MathHelper::percentile(values, 150.0));
    EXPECT_DOUBLE_EQ(7.0, MathHelper::percentile({7.0}, 95.0));
    EXPECT_TRUE(std::isnan(MathHelper::percentile({}, 95.0)));
}
