#include <gtest/gtest.h>

#include "navigator/position_resolver.h"

#include <cmath>
#include <limits>
#include <vector>

using navigator::FixMethod;
using navigator::PositionResolver;
using navigator::RangeMeasurement;

namespace {

RangeMeasurement rangeTo(double bx, double by, double tx, double ty) {
    double d = std::hypot(tx - bx, ty - by);
    return {bx, by, d, 1.0 / (d * d)};
}

config::ResolverSettings withRefine(bool refine) {
    config::ResolverSettings settings;
    settings.refine = refine;
    return settings;
}

}  // namespace

class ResolverTest : public ::testing::TestWithParam<bool> {};

TEST_P(ResolverTest, ThreeBeaconsRecoverExactPosition)
{
    PositionResolver resolver(withRefine(GetParam()));
    std::vector<RangeMeasurement> ranges = {
        rangeTo(0, 0, 3, 4),
        rangeTo(10, 0, 3, 4),
        rangeTo(0, 10, 3, 4),
    };
    // 5, sqrt(65), sqrt(45)
    EXPECT_NEAR(ranges[1].distance, std::sqrt(65.0), 1e-12);
    EXPECT_NEAR(ranges[2].distance, std::sqrt(45.0), 1e-12);

    auto fix = resolver.resolve(ranges);
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->method, FixMethod::Multilateration);
    EXPECT_NEAR(fix->x, 3.0, 0.01);
    EXPECT_NEAR(fix->y, 4.0, 0.01);
    EXPECT_LT(fix->rmsResidual, 1e-3);
    EXPECT_GT(fix->confidence, 0.99);
    EXPECT_FALSE(fix->degenerate);
}

TEST_P(ResolverTest, NoisyRangesStayClose)
{
    PositionResolver resolver(withRefine(GetParam()));
    std::vector<RangeMeasurement> ranges = {
        rangeTo(0, 0, 6, 2),
        rangeTo(10, 0, 6, 2),
        rangeTo(0, 10, 6, 2),
        rangeTo(10, 10, 6, 2),
    };
    ranges[0].distance += 0.2;
    ranges[1].distance -= 0.15;
    ranges[2].distance += 0.1;
    ranges[3].distance -= 0.2;

    auto fix = resolver.resolve(ranges);
    ASSERT_TRUE(fix.has_value());
    EXPECT_NEAR(fix->x, 6.0, 0.5);
    EXPECT_NEAR(fix->y, 2.0, 0.5);
    EXPECT_GT(fix->rmsResidual, 0.0);
    EXPECT_LT(fix->confidence, 1.0);
}

INSTANTIATE_TEST_SUITE_P(RefineOnOff, ResolverTest, ::testing::Bool());

TEST(PositionResolverTest, LessThanTwoBeaconsIsInsufficient)
{
    PositionResolver resolver;
    EXPECT_FALSE(resolver.resolve({}).has_value());
    EXPECT_FALSE(resolver.resolve({{1.0, 1.0, 2.0, 0.25}}).has_value());
}

TEST(PositionResolverTest, TwoBeaconsGivePointOnSegment)
{
    PositionResolver resolver;
    auto fix = resolver.resolve({{0, 0, 3.0, 1.0 / 9.0}, {10, 0, 7.0, 1.0 / 49.0}});
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->method, FixMethod::TwoBeacon);
    EXPECT_NEAR(fix->x, 3.0, 1e-9);
    EXPECT_NEAR(fix->y, 0.0, 1e-9);
    EXPECT_LE(fix->confidence, 0.5);
}

TEST(PositionResolverTest, TwoBeaconsOnDiagonalStayCollinear)
{
    PositionResolver resolver;
    // сумма дальностей больше длины отрезка
    auto fix = resolver.resolve({{1, 1, 2.0, 0.25}, {5, 4, 6.0, 1.0 / 36.0}});
    ASSERT_TRUE(fix.has_value());

    double cross = (5 - 1) * (fix->y - 1) - (4 - 1) * (fix->x - 1);
    EXPECT_NEAR(cross, 0.0, 1e-9);
    EXPECT_GE(fix->x, 1.0);
    EXPECT_LE(fix->x, 5.0);
}

TEST(PositionResolverTest, TwoBeaconsFarBeyondSegmentAreClamped)
{
    PositionResolver resolver;
    auto fix = resolver.resolve({{0, 0, 30.0, 1.0}, {4, 0, 1.0, 1.0}});
    ASSERT_TRUE(fix.has_value());
    EXPECT_NEAR(fix->x, 4.0, 1e-9);
    EXPECT_NEAR(fix->y, 0.0, 1e-9);
}

TEST(PositionResolverTest, CollinearBeaconsFallBackToCentroid)
{
    PositionResolver resolver;
    auto fix = resolver.resolve({{0, 0, 5.0, 0.04}, {5, 0, 1.0, 1.0}, {10, 0, 5.0, 0.04}});
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->method, FixMethod::Centroid);
    EXPECT_TRUE(fix->degenerate);
    // веса 1/d: 0.2, 1, 0.2
    EXPECT_NEAR(fix->x, 5.0, 1e-9);
    EXPECT_NEAR(fix->y, 0.0, 1e-9);
    EXPECT_LE(fix->confidence, 0.25);
}

TEST(PositionResolverTest, UnusableMeasurementsAreIgnored)
{
    PositionResolver resolver;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto fix = resolver.resolve({{0, 0, 3.0, 1.0}, {10, 0, 7.0, 1.0}, {0, 10, nan, 1.0}});
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->method, FixMethod::TwoBeacon);

    EXPECT_FALSE(resolver.resolve({{0, 0, 3.0, 1.0}, {10, 0, -1.0, 1.0}}).has_value());
}

TEST(PositionResolverTest, MethodNames)
{
    EXPECT_STREQ(navigator::toString(FixMethod::Multilateration), "multilateration");
    EXPECT_STREQ(navigator::toString(FixMethod::TwoBeacon), "two_beacon");
    EXPECT_STREQ(navigator::toString(FixMethod::Centroid), "centroid");
}
