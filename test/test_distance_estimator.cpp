#include <gtest/gtest.h>

#include "navigator/distance_estimator.h"
#include "test_helpers.h"

#include <cmath>

using navigator::DistanceEstimator;
using test_helpers::makeBeacon;

TEST(DistanceEstimatorTest, TxPowerMeansOneMeter)
{
    DistanceEstimator estimator;
    auto beacon = makeBeacon("AA:BB:CC:DD:EE:01", 0, 0, -59);

    auto estimate = estimator.estimateDistance(-59, beacon, 2.5);
    EXPECT_NEAR(estimate.distance, 1.0, 1e-12);
    EXPECT_NEAR(estimate.weight, 1.0, 1e-12);
}

TEST(DistanceEstimatorTest, FollowsLogDistanceModel)
{
    DistanceEstimator estimator;
    auto beacon = makeBeacon("AA:BB:CC:DD:EE:01", 0, 0, -59);

    // 20 дБ при n = 2 дают десятикратное расстояние
    auto estimate = estimator.estimateDistance(-79, beacon, 2.0);
    EXPECT_NEAR(estimate.distance, 10.0, 1e-9);
    EXPECT_NEAR(estimate.weight, 0.01, 1e-12);
}

TEST(DistanceEstimatorTest, MonotonicallyNonIncreasingInRssi)
{
    DistanceEstimator estimator;
    for (int tx : {-75, -59, -40}) {
        auto beacon = makeBeacon("AA:BB:CC:DD:EE:01", 0, 0, tx);
        for (double n : {1.0, 2.5, 6.0}) {
            double previous = estimator.estimateDistance(-127, beacon, n).distance;
            for (int rssi = -126; rssi < 0; ++rssi) {
                double current = estimator.estimateDistance(rssi, beacon, n).distance;
                EXPECT_LE(current, previous) << "tx=" << tx << " n=" << n << " rssi=" << rssi;
                previous = current;
            }
        }
    }
}

TEST(DistanceEstimatorTest, ClampsToConfiguredRange)
{
    config::DistanceSettings settings;
    settings.minDistance = 0.2;
    settings.maxDistance = 30.0;
    DistanceEstimator estimator(settings);
    auto beacon = makeBeacon("AA:BB:CC:DD:EE:01", 0, 0, -59);

    EXPECT_DOUBLE_EQ(estimator.estimateDistance(-127, beacon, 1.0).distance, 30.0);
    EXPECT_DOUBLE_EQ(estimator.estimateDistance(-1, beacon, 6.0).distance, 0.2);
}

TEST(DistanceEstimatorTest, WeightHasNearFieldFloor)
{
    config::DistanceSettings settings;
    settings.minDistance = 0.01;
    settings.weightEpsilon = 0.5;
    DistanceEstimator estimator(settings);

    EXPECT_DOUBLE_EQ(estimator.weightFor(0.01), 4.0);
    EXPECT_DOUBLE_EQ(estimator.weightFor(2.0), 0.25);
}

TEST(DistanceEstimatorTest, RejectsInvalidSettings)
{
    config::DistanceSettings settings;
    settings.minDistance = 10.0;
    settings.maxDistance = 5.0;
    EXPECT_THROW(DistanceEstimator{settings}, config::InvalidConfiguration);
}

TEST(DistanceEstimatorTest, ValidRssiRange)
{
    EXPECT_FALSE(DistanceEstimator::isValidRssi(0));
    EXPECT_FALSE(DistanceEstimator::isValidRssi(5));
    EXPECT_FALSE(DistanceEstimator::isValidRssi(-200));
    EXPECT_TRUE(DistanceEstimator::isValidRssi(-60));
}

TEST(MedianTest, SmallSetsUsePlainMedian)
{
    EXPECT_DOUBLE_EQ(navigator::calculateMedian({3.0}), 3.0);
    EXPECT_DOUBLE_EQ(navigator::calculateMedian({4.0, 2.0}), 3.0);
    EXPECT_DOUBLE_EQ(navigator::calculateMedian({5.0, 1.0, 2.0}), 2.0);
}

TEST(MedianTest, DropsOutliersByIqr)
{
    // q1 = 2, q3 = 4, выброс 100 за пределами [-1, 7]
    EXPECT_DOUBLE_EQ(navigator::calculateMedian({1.0, 2.0, 2.5, 3.0, 4.0, 100.0}), 2.5);
}

TEST(MedianTest, EmptyInputThrows)
{
    EXPECT_THROW(navigator::calculateMedian({}), std::invalid_argument);
}
