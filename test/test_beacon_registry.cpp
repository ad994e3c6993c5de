#include <gtest/gtest.h>

#include "navigator/beacon_registry.h"
#include "test_helpers.h"

#include <atomic>
#include <cstdio>
#include <thread>
#include <vector>

using message_objects::BeaconId;
using navigator::BeaconRegistry;
using test_helpers::makeBeacon;

TEST(BeaconRegistryTest, EmptyByDefault)
{
    BeaconRegistry registry;
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.lookup(BeaconId::fromMac("AA:00:00:00:00:01")).has_value());
}

TEST(BeaconRegistryTest, LooksUpByPrimaryAndAlternateId)
{
    auto site = test_helpers::squareSite();
    message_objects::BLEBeacon ibeacon;
    ibeacon.id_ = BeaconId::fromIBeacon("e2c56db5-dffb-48d2-b060-d0f5a71096e0", 1, 7);
    ibeacon.altId_ = BeaconId::fromMac("BB:00:00:00:00:07");
    ibeacon.x_ = 4.0;
    ibeacon.y_ = 6.0;
    site.beacons.push_back(ibeacon);

    BeaconRegistry registry(site);
    EXPECT_EQ(registry.size(), 5u);
    EXPECT_DOUBLE_EQ(registry.propagationFactor(), test_helpers::kPropagation);

    auto byMac = registry.lookup(BeaconId::fromMac("aa-00-00-00-00-02"));
    ASSERT_TRUE(byMac.has_value());
    EXPECT_DOUBLE_EQ(byMac->x_, 10.0);

    auto byUuid = registry.lookup(BeaconId::fromIBeacon("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", 1, 7));
    auto byAlt = registry.lookup(BeaconId::fromMac("BB:00:00:00:00:07"));
    ASSERT_TRUE(byUuid.has_value());
    ASSERT_TRUE(byAlt.has_value());
    EXPECT_EQ(byUuid->id_, byAlt->id_);
    EXPECT_DOUBLE_EQ(byAlt->y_, 6.0);
}

TEST(BeaconRegistryTest, ReloadReplacesWholeSet)
{
    BeaconRegistry registry(test_helpers::squareSite());
    auto before = registry.snapshot();

    registry.reload({makeBeacon("CC:00:00:00:00:01", 1.0, 1.0)}, config::SignalSettings{3.0});

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_DOUBLE_EQ(registry.propagationFactor(), 3.0);
    EXPECT_FALSE(registry.lookup(BeaconId::fromMac("AA:00:00:00:00:01")).has_value());
    EXPECT_TRUE(registry.lookup(BeaconId::fromMac("CC:00:00:00:00:01")).has_value());
    EXPECT_GT(registry.snapshot()->generation, before->generation);

    // старый снимок остается целым у тех, кто его держит
    EXPECT_EQ(before->beaconCount, 4u);
    EXPECT_NE(before->find(BeaconId::fromMac("AA:00:00:00:00:01")), nullptr);
}

TEST(BeaconRegistryTest, InvalidReloadKeepsPreviousSet)
{
    BeaconRegistry registry(test_helpers::squareSite());

    EXPECT_THROW(registry.reload({makeBeacon("CC:00:00:00:00:01", 1.0, 1.0)},
                                 config::SignalSettings{0.5}),
                 config::InvalidConfiguration);
    EXPECT_THROW(registry.reload({makeBeacon("CC:00:00:00:00:01", 1.0, 1.0),
                                  makeBeacon("cc:00:00:00:00:01", 2.0, 2.0)},
                                 config::SignalSettings{2.0}),
                 config::InvalidConfiguration);

    EXPECT_EQ(registry.size(), 4u);
    EXPECT_DOUBLE_EQ(registry.propagationFactor(), test_helpers::kPropagation);
}

TEST(BeaconRegistryTest, ReadersNeverSeeMixedSets)
{
    // два набора с одинаковыми id, различаются txPower и n
    std::vector<message_objects::BLEBeacon> setA;
    std::vector<message_objects::BLEBeacon> setB;
    for (int i = 0; i < 16; ++i) {
        char mac[18];
        std::snprintf(mac, sizeof(mac), "DD:00:00:00:00:%02X", i);
        setA.push_back(makeBeacon(mac, i, 0.0, -50));
        setB.push_back(makeBeacon(mac, i, 1.0, -70));
    }

    BeaconRegistry registry;
    registry.reload(setA, config::SignalSettings{2.0});

    std::atomic<bool> done{false};
    std::atomic<int> mixed{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                auto snapshot = registry.snapshot();
                const bool isA = snapshot->propagationFactor == 2.0;
                const int tx = isA ? -50 : -70;
                if (snapshot->beaconCount != 16)
                    ++mixed;
                for (const auto& entry : snapshot->beacons) {
                    if (entry.second.txPower_ != tx)
                        ++mixed;
                }
            }
        });
    }

    for (int i = 0; i < 500; ++i) {
        if (i % 2 == 0)
            registry.reload(setB, config::SignalSettings{3.0});
        else
            registry.reload(setA, config::SignalSettings{2.0});
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(mixed.load(), 0);
    EXPECT_EQ(registry.snapshot()->generation, 501u);
}
