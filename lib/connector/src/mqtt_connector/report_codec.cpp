#include "mqtt_connector/report_codec.h"
#include "mqtt_connector/types.h"

#include <nlohmann/json.hpp>

#include <initializer_list>

using nlohmann::json;
using namespace message_objects;

namespace mqtt_connector {

namespace {

const json* findField(const json& object, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = object.find(name);
        if (it != object.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

DetectedBeacon decodeBeacon(const json& entry, int64_t reportTimestamp) {
    if (!entry.is_object())
        throw ReportDecodeError("beacon entry is not an object");

    const json* rssi = findField(entry, {"rssi"});
    if (!rssi || !rssi->is_number())
        throw ReportDecodeError("beacon entry without numeric rssi");

    DetectedBeacon beacon;
    beacon.rssi_ = rssi->get<int>();
    beacon.timestamp_ = reportTimestamp;
    if (const json* ts = findField(entry, {"timestamp"}))
        beacon.timestamp_ = ts->get<int64_t>();

    try {
        if (const json* uuid = findField(entry, {"uuid"})) {
            const json* major = findField(entry, {"major"});
            const json* minor = findField(entry, {"minor"});
            if (!major || !minor)
                throw ReportDecodeError("uuid beacon without major/minor");
            beacon.id_ = BeaconId::fromIBeacon(uuid->get<std::string>(), major->get<int>(),
                                               minor->get<int>());
        } else if (const json* mac = findField(entry, {"macAddress", "deviceId", "mac"})) {
            beacon.id_ = BeaconId::fromMac(mac->get<std::string>());
        } else {
            throw ReportDecodeError("beacon entry without identity");
        }
    } catch (const std::invalid_argument& e) {
        throw ReportDecodeError(e.what());
    }

    return beacon;
}

json encodeBeacon(const DetectedBeacon& beacon) {
    json out;
    const std::string& key = beacon.id_.key();
    auto firstSlash = key.find('/');
    if (firstSlash == std::string::npos) {
        out["macAddress"] = key;
    } else {
        // fromIBeacon гарантирует ровно два '/' и десятичные major/minor
        auto secondSlash = key.find('/', firstSlash + 1);
        out["uuid"] = key.substr(0, firstSlash);
        out["major"] = std::stoi(key.substr(firstSlash + 1, secondSlash - firstSlash - 1));
        out["minor"] = std::stoi(key.substr(secondSlash + 1));
    }
    out["rssi"] = beacon.rssi_;
    return out;
}

json toJson(const navigator::TrackerView& view) {
    const auto& state = view.state;
    json out;
    out["trackerId"] = state.trackerId;
    if (state.position) {
        out["x"] = state.position->x;
        out["y"] = state.position->y;
    } else {
        out["x"] = nullptr;
        out["y"] = nullptr;
    }
    out["status"] = navigator::toString(view.status);
    out["last_update_time"] = state.lastUpdateTime;
    if (state.lastKnownMeasurementTime)
        out["last_known_measurement_time"] = *state.lastKnownMeasurementTime;
    else
        out["last_known_measurement_time"] = nullptr;

    json beacons = json::array();
    for (const auto& beacon : state.lastDetectedBeacons) {
        beacons.push_back(encodeBeacon(beacon));
    }
    out["last_detected_beacons"] = std::move(beacons);

    json history = json::array();
    for (const auto& sample : state.positionHistory.samples()) {
        history.push_back(json::array({sample.x_, sample.y_, sample.timestamp_}));
    }
    out["position_history"] = std::move(history);
    return out;
}

}  // namespace

ReportCodec::ReportCodec(std::string topicFilter) : topicFilter_(std::move(topicFilter)) {
    if (topicFilter_.empty())
        return;

    auto levels = splitTopic(topicFilter_);
    for (std::size_t i = 0; i < levels.size(); ++i) {
        if (levels[i] == "+") {
            trackerLevel_ = i;
            break;
        }
    }
}

std::optional<std::string> ReportCodec::trackerIdFromTopic(const std::string& topic) const {
    if (!trackerLevel_ || !topicMatches(topicFilter_, topic))
        return std::nullopt;

    auto levels = splitTopic(topic);
    if (*trackerLevel_ >= levels.size() || levels[*trackerLevel_].empty())
        return std::nullopt;
    return levels[*trackerLevel_];
}

DecodedReport ReportCodec::decode(const std::string& payload, const std::string& topic) const {
    json document;
    try {
        document = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw ReportDecodeError(std::string("malformed JSON: ") + e.what());
    }
    if (!document.is_object())
        throw ReportDecodeError("report payload must be a JSON object");

    DecodedReport decoded;
    auto& report = decoded.report;

    try {
        if (const json* id = findField(document, {"trackerId", "devEui"})) {
            report.trackerId_ = id->get<std::string>();
        } else if (auto fromTopic = trackerIdFromTopic(topic)) {
            report.trackerId_ = *fromTopic;
        }
        if (report.trackerId_.empty())
            throw ReportDecodeError("report without trackerId");

        const json* timestamp = findField(document, {"timestamp"});
        if (!timestamp || !timestamp->is_number_integer())
            throw ReportDecodeError("report without integer timestamp");
        report.timestamp_ = timestamp->get<int64_t>();

        const json* beacons = findField(document, {"detectedBeacons", "beacons"});
        if (beacons && !beacons->is_array())
            throw ReportDecodeError("detectedBeacons must be an array");

        if (beacons) {
            for (const auto& entry : *beacons) {
                try {
                    report.detectedBeacons_.push_back(decodeBeacon(entry, report.timestamp_));
                } catch (const ReportDecodeError& e) {
                    decoded.droppedEntries.push_back(e.what());
                } catch (const json::exception& e) {
                    decoded.droppedEntries.push_back(e.what());
                }
            }
        }
    } catch (const json::exception& e) {
        throw ReportDecodeError(std::string("invalid report: ") + e.what());
    }

    return decoded;
}

std::string ReportCodec::encodeState(const navigator::TrackerView& view) {
    return toJson(view).dump();
}

std::string ReportCodec::encodeSnapshot(const std::vector<navigator::TrackerView>& views) {
    json out = json::array();
    for (const auto& view : views) {
        out.push_back(toJson(view));
    }
    return out.dump();
}

} // namespace mqtt_connector
