#include <gtest/gtest.h>

#include "mqtt_connector/message_handler.h"
#include "mqtt_connector/report_codec.h"
#include "mqtt_connector/types.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using mqtt_connector::ReportCodec;
using mqtt_connector::ReportDecodeError;
using message_objects::BeaconId;

namespace {
const std::string kFilter = "/device_sensor_data/warehouse/+/+/+/+";
}

TEST(ReportCodecTest, DecodesBeaconAliases)
{
    ReportCodec codec;
    auto decoded = codec.decode(R"({
        "trackerId": "tracker-7",
        "timestamp": 1700000000123,
        "detectedBeacons": [
            {"macAddress": "aa:bb:cc:dd:ee:01", "rssi": -60},
            {"deviceId": "AA-BB-CC-DD-EE-02", "rssi": -71, "timestamp": 1700000000100},
            {"mac": "aabbccddee03", "rssi": -80},
            {"uuid": "e2c56db5-dffb-48d2-b060-d0f5a71096e0", "major": 1, "minor": 2, "rssi": -55}
        ]
    })");

    const auto& report = decoded.report;
    EXPECT_TRUE(decoded.droppedEntries.empty());
    EXPECT_EQ(report.trackerId_, "tracker-7");
    EXPECT_EQ(report.timestamp_, 1700000000123);
    ASSERT_EQ(report.detectedBeacons_.size(), 4u);
    EXPECT_EQ(report.detectedBeacons_[0].id_, BeaconId::fromMac("AA:BB:CC:DD:EE:01"));
    EXPECT_EQ(report.detectedBeacons_[0].timestamp_, 1700000000123);
    EXPECT_EQ(report.detectedBeacons_[1].id_.key(), "AA:BB:CC:DD:EE:02");
    EXPECT_EQ(report.detectedBeacons_[1].timestamp_, 1700000000100);
    EXPECT_EQ(report.detectedBeacons_[2].rssi_, -80);
    EXPECT_EQ(report.detectedBeacons_[3].id_,
              BeaconId::fromIBeacon("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", 1, 2));
}

TEST(ReportCodecTest, TakesTrackerIdFromTopic)
{
    ReportCodec codec(kFilter);
    auto decoded = codec.decode(R"({"timestamp": 5, "beacons": []})",
                                "/device_sensor_data/warehouse/dev-42/ble/raw/0");
    EXPECT_EQ(decoded.report.trackerId_, "dev-42");
    EXPECT_TRUE(decoded.report.detectedBeacons_.empty());

    // поле в payload важнее топика
    auto explicitId = codec.decode(R"({"devEui": "from-payload", "timestamp": 5})",
                                   "/device_sensor_data/warehouse/dev-42/ble/raw/0");
    EXPECT_EQ(explicitId.report.trackerId_, "from-payload");

    EXPECT_FALSE(codec.trackerIdFromTopic("/other/warehouse/dev-42/ble/raw/0").has_value());
}

TEST(ReportCodecTest, DropsBadEntriesKeepsReport)
{
    ReportCodec codec;
    auto decoded = codec.decode(R"({
        "trackerId": "t", "timestamp": 10,
        "detectedBeacons": [
            {"macAddress": "AA:BB:CC:DD:EE:01"},
            {"macAddress": "AA:BB:CC:DD:EE:02", "rssi": "-60"},
            {"rssi": -60},
            {"macAddress": "not-a-mac", "rssi": -60},
            {"uuid": "e2c56db5-dffb-48d2-b060-d0f5a71096e0", "rssi": -60},
            42,
            {"macAddress": "AA:BB:CC:DD:EE:03", "rssi": -60}
        ]
    })");

    EXPECT_EQ(decoded.droppedEntries.size(), 6u);
    ASSERT_EQ(decoded.report.detectedBeacons_.size(), 1u);
    EXPECT_EQ(decoded.report.detectedBeacons_[0].id_.key(), "AA:BB:CC:DD:EE:03");
}

TEST(ReportCodecTest, DropsMalformedUuidsAndEncodesAcceptedOnes)
{
    ReportCodec codec;
    auto decoded = codec.decode(R"({
        "trackerId": "t", "timestamp": 10,
        "detectedBeacons": [
            {"uuid": "e2c56db5/dffb-48d2-b060-d0f5a71096e0", "major": 1, "minor": 2, "rssi": -60},
            {"uuid": "e2c56db5-dffb-48d2-b060-d0f5a71096zz", "major": 1, "minor": 2, "rssi": -60},
            {"uuid": "e2c56db5-dffb", "major": 1, "minor": 2, "rssi": -60},
            {"uuid": "E2C56DB5DFFB48D2B060D0F5A71096E0", "major": 1, "minor": 2, "rssi": -60}
        ]
    })");

    EXPECT_EQ(decoded.droppedEntries.size(), 3u);
    ASSERT_EQ(decoded.report.detectedBeacons_.size(), 1u);

    navigator::TrackerView view;
    view.state.trackerId = "t";
    view.state.lastDetectedBeacons = decoded.report.detectedBeacons_;
    std::string payload;
    ASSERT_NO_THROW(payload = ReportCodec::encodeState(view));
    EXPECT_NE(payload.find("E2C56DB5DFFB48D2B060D0F5A71096E0"), std::string::npos);

    EXPECT_THROW(BeaconId::fromIBeacon("../../etc/passwd", 1, 2), std::invalid_argument);
}

TEST(ReportCodecTest, RejectsUnusableReports)
{
    ReportCodec codec;
    EXPECT_THROW(codec.decode("not json"), ReportDecodeError);
    EXPECT_THROW(codec.decode("[]"), ReportDecodeError);
    EXPECT_THROW(codec.decode(R"({"trackerId": "t"})"), ReportDecodeError);
    EXPECT_THROW(codec.decode(R"({"trackerId": "t", "timestamp": "yesterday"})"), ReportDecodeError);
    EXPECT_THROW(codec.decode(R"({"timestamp": 1})"), ReportDecodeError);
    EXPECT_THROW(codec.decode(R"({"trackerId": "t", "timestamp": 1, "detectedBeacons": {}})"),
                 ReportDecodeError);
}

TEST(ReportCodecTest, EncodesTrackerState)
{
    navigator::TrackerView view;
    view.state.trackerId = "t1";
    view.state.position = navigator::Position{1.5, -2.0};
    view.state.lastUpdateTime = 9000;
    view.state.lastKnownMeasurementTime = 8000;
    view.state.lastDetectedBeacons = {
        {BeaconId::fromMac("AA:BB:CC:DD:EE:01"), -60, 8000},
        {BeaconId::fromIBeacon("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", 4, 5), -70, 8000},
    };
    view.state.positionHistory.push({1.0, -1.0, 7000});
    view.state.positionHistory.push({1.5, -2.0, 8000});
    view.status = navigator::TrackerStatus::Active;

    auto json = nlohmann::json::parse(ReportCodec::encodeState(view));
    EXPECT_EQ(json["trackerId"], "t1");
    EXPECT_DOUBLE_EQ(json["x"].get<double>(), 1.5);
    EXPECT_DOUBLE_EQ(json["y"].get<double>(), -2.0);
    EXPECT_EQ(json["status"], "active");
    EXPECT_EQ(json["last_update_time"], 9000);
    EXPECT_EQ(json["last_known_measurement_time"], 8000);

    ASSERT_EQ(json["last_detected_beacons"].size(), 2u);
    EXPECT_EQ(json["last_detected_beacons"][0]["macAddress"], "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(json["last_detected_beacons"][0]["rssi"], -60);
    EXPECT_EQ(json["last_detected_beacons"][1]["uuid"], "E2C56DB5-DFFB-48D2-B060-D0F5A71096E0");
    EXPECT_EQ(json["last_detected_beacons"][1]["major"], 4);
    EXPECT_EQ(json["last_detected_beacons"][1]["minor"], 5);

    ASSERT_EQ(json["position_history"].size(), 2u);
    EXPECT_EQ(json["position_history"][0][2], 7000);
    EXPECT_DOUBLE_EQ(json["position_history"][1][0].get<double>(), 1.5);
}

TEST(ReportCodecTest, EncodesUnknownPositionAsNull)
{
    navigator::TrackerView a;
    a.state.trackerId = "a";
    navigator::TrackerView b;
    b.state.trackerId = "b";

    auto json = nlohmann::json::parse(ReportCodec::encodeSnapshot({a, b}));
    ASSERT_EQ(json.size(), 2u);
    EXPECT_TRUE(json[0]["x"].is_null());
    EXPECT_TRUE(json[0]["last_known_measurement_time"].is_null());
    EXPECT_EQ(json[0]["status"], "unknown");
    EXPECT_EQ(json[1]["trackerId"], "b");
}

TEST(TopicTest, WildcardMatching)
{
    using mqtt_connector::topicMatches;
    EXPECT_TRUE(topicMatches("a/+/c", "a/b/c"));
    EXPECT_FALSE(topicMatches("a/+/c", "a/b/d"));
    EXPECT_FALSE(topicMatches("a/+", "a/b/c"));
    EXPECT_TRUE(topicMatches("a/#", "a/b/c"));
    EXPECT_TRUE(topicMatches("#", "anything/at/all"));
    EXPECT_TRUE(topicMatches(kFilter, "/device_sensor_data/warehouse/1/2/3/4"));
}

TEST(MessageHandlerTest, DispatchesByFilter)
{
    mqtt_connector::MessageHandler handler;
    std::vector<std::string> seen;
    handler.registerHandler("sensors/+/ble", [&](const mqtt_connector::Message& m) {
        seen.push_back("ble:" + m.topic);
    });
    handler.setDefaultHandler([&](const mqtt_connector::Message& m) {
        seen.push_back("default:" + m.topic);
    });

    EXPECT_TRUE(handler.handleMessage({"sensors/t1/ble", "{}"}));
    EXPECT_FALSE(handler.handleMessage({"other", "{}"}));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "ble:sensors/t1/ble");
    EXPECT_EQ(seen[1], "default:other");

    handler.unregisterHandler("sensors/+/ble");
    EXPECT_TRUE(handler.getRegisteredTopics().empty());
}
