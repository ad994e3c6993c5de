#include "config/config.h"
#include "message_objects/BLE.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

using nlohmann::json;
using namespace message_objects;

namespace config {

namespace {

constexpr size_t kMaxCapacity = 1000000;
constexpr unsigned kMaxWorkerThreads = 1024;

// Первое присутствующее поле из списка псевдонимов; null считается отсутствием
const json* findField(const json& object, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = object.find(name);
        if (it != object.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

template <typename T>
std::optional<T> optionalField(const json& object, std::initializer_list<const char*> names) {
    const json* field = findField(object, names);
    if (!field) {
        return std::nullopt;
    }
    return field->get<T>();
}

template <typename T>
T requiredField(const json& object, std::initializer_list<const char*> names,
                const std::string& context) {
    const json* field = findField(object, names);
    if (!field) {
        throw InvalidConfiguration(context + ": missing field '" + *names.begin() + "'");
    }
    return field->get<T>();
}

template <typename T>
void readInto(const json& object, const char* name, T& target) {
    if (auto value = optionalField<T>(object, {name})) {
        target = *value;
    }
}

// Счетчики и размеры: только неотрицательное целое, иначе get<size_t> молча заворачивает -1
template <typename T>
void readCount(const json& object, const char* name, T& target) {
    const json* field = findField(object, {name});
    if (!field) {
        return;
    }
    if (!field->is_number_unsigned() ||
        field->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw InvalidConfiguration(std::string(name) + " must be a non-negative integer, got " +
                                   field->dump());
    }
    target = field->get<T>();
}

void requireRange(double value, double lo, double hi, const std::string& name) {
    if (!std::isfinite(value) || value < lo || value > hi) {
        std::ostringstream out;
        out << name << " = " << value << " is outside [" << lo << ", " << hi << "]";
        throw InvalidConfiguration(out.str());
    }
}

BLEBeacon parseBeacon(const json& entry, size_t index) {
    const std::string context = "beacons[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        throw InvalidConfiguration(context + ": expected an object");
    }

    BLEBeacon beacon;
    auto mac = optionalField<std::string>(entry, {"macAddress", "deviceId"});
    auto uuid = optionalField<std::string>(entry, {"uuid"});

    try {
        if (uuid) {
            int major = requiredField<int>(entry, {"major"}, context);
            int minor = requiredField<int>(entry, {"minor"}, context);
            beacon.id_ = BeaconId::fromIBeacon(*uuid, major, minor);
            if (mac) {
                beacon.altId_ = BeaconId::fromMac(*mac);
            }
        } else if (mac) {
            beacon.id_ = BeaconId::fromMac(*mac);
        } else {
            throw InvalidConfiguration(context + ": needs macAddress/deviceId or uuid+major+minor");
        }
    } catch (const std::invalid_argument& e) {
        throw InvalidConfiguration(context + ": " + e.what());
    }

    beacon.name_ = optionalField<std::string>(entry, {"name", "displayName"});
    beacon.txPower_ = requiredField<int>(entry, {"txPower"}, context);
    beacon.x_ = requiredField<double>(entry, {"x"}, context);
    beacon.y_ = requiredField<double>(entry, {"y"}, context);
    return beacon;
}

MotionModel parseMotionModel(const std::string& value) {
    if (value == "constant_position") {
        return MotionModel::ConstantPosition;
    }
    if (value == "constant_velocity") {
        return MotionModel::ConstantVelocity;
    }
    throw InvalidConfiguration("kalman.motionModel: unknown model '" + value + "'");
}

OverflowPolicy parseOverflowPolicy(const std::string& value) {
    if (value == "drop_oldest") {
        return OverflowPolicy::DropOldest;
    }
    if (value == "drop_newest") {
        return OverflowPolicy::DropNewest;
    }
    throw InvalidConfiguration("tracker.overflowPolicy: unknown policy '" + value + "'");
}

MqttServerConfig parseMqtt(const json& node) {
    const std::string context = "mqtt";
    MqttServerConfig mqtt;
    mqtt.brokerHost = requiredField<std::string>(node, {"brokerHost"}, context);
    readInto(node, "brokerPort", mqtt.brokerPort);
    mqtt.username = optionalField<std::string>(node, {"username"});
    mqtt.password = optionalField<std::string>(node, {"password"});
    mqtt.applicationID = requiredField<std::string>(node, {"applicationID"}, context);
    mqtt.topicPattern = requiredField<std::string>(node, {"topicPattern"}, context);
    mqtt.clientID = optionalField<std::string>(node, {"clientID", "clientId"});
    readInto(node, "enabled", mqtt.enabled);
    mqtt.publishTopic = optionalField<std::string>(node, {"publishTopic"});
    return mqtt;
}

json parseDocument(const std::string& jsonText) {
    try {
        json document = json::parse(jsonText);
        if (!document.is_object()) {
            throw InvalidConfiguration("configuration root must be a JSON object");
        }
        return document;
    } catch (const json::parse_error& e) {
        throw InvalidConfiguration(std::string("malformed JSON: ") + e.what());
    }
}

}  // namespace

void validate(const SignalSettings& settings) {
    requireRange(settings.signalPropagationFactor, 1.0, 6.0, "settings.signalPropagationFactor");
}

void validate(const DistanceSettings& settings) {
    if (!(settings.minDistance > 0.0) || !(settings.maxDistance > settings.minDistance)) {
        throw InvalidConfiguration("distance: require 0 < minDistance < maxDistance");
    }
    if (!(settings.weightEpsilon > 0.0)) {
        throw InvalidConfiguration("distance.weightEpsilon must be positive");
    }
}

void validate(const ResolverSettings& settings) {
    if (!(settings.residualScale > 0.0)) {
        throw InvalidConfiguration("resolver.residualScale must be positive");
    }
    requireRange(settings.degenerateThreshold, 0.0, 1.0, "resolver.degenerateThreshold");
}

void validate(const KalmanParams& params) {
    if (!std::isfinite(params.processVariance) || params.processVariance < 0.0) {
        throw InvalidConfiguration("kalman.processVariance must be >= 0");
    }
    if (!std::isfinite(params.measurementVariance) || params.measurementVariance <= 0.0) {
        throw InvalidConfiguration("kalman.measurementVariance must be > 0");
    }
}

void validate(const TrackerSettings& settings) {
    if (settings.historyCapacity == 0) {
        throw InvalidConfiguration("tracker.historyCapacity must be at least 1");
    }
    if (settings.queueCapacity == 0) {
        throw InvalidConfiguration("tracker.queueCapacity must be at least 1");
    }
    if (settings.historyCapacity > kMaxCapacity || settings.queueCapacity > kMaxCapacity) {
        throw InvalidConfiguration("tracker capacities must not exceed " + std::to_string(kMaxCapacity));
    }
    if (settings.workerThreads > kMaxWorkerThreads) {
        throw InvalidConfiguration("tracker.workerThreads must not exceed " +
                                   std::to_string(kMaxWorkerThreads));
    }
    if (settings.staleAfterMs <= 0) {
        throw InvalidConfiguration("tracker.staleAfterMs must be positive");
    }
    if (settings.hardResetAfterMs < settings.staleAfterMs) {
        throw InvalidConfiguration("tracker.hardResetAfterMs must not be shorter than staleAfterMs");
    }
}

void validate(const MqttServerConfig& mqtt) {
    if (mqtt.brokerHost.empty()) {
        throw InvalidConfiguration("mqtt.brokerHost is empty");
    }
    if (mqtt.brokerPort <= 0 || mqtt.brokerPort > 65535) {
        throw InvalidConfiguration("mqtt.brokerPort out of range: " + std::to_string(mqtt.brokerPort));
    }
    if (mqtt.topicPattern.empty()) {
        throw InvalidConfiguration("mqtt.topicPattern is empty");
    }
}

void validate(const SiteConfig& site) {
    validate(site.settings);

    std::set<BeaconId> seen;
    for (const auto& beacon : site.beacons) {
        if (!std::isfinite(beacon.x_) || !std::isfinite(beacon.y_)) {
            throw InvalidConfiguration("beacon " + beacon.id_.key() + " has non-finite coordinates");
        }
        if (beacon.txPower_ >= 0 || beacon.txPower_ < -127) {
            throw InvalidConfiguration("beacon " + beacon.id_.key() + " has implausible txPower " +
                                       std::to_string(beacon.txPower_));
        }
        if (!seen.insert(beacon.id_).second) {
            throw InvalidConfiguration("duplicate beacon " + beacon.id_.key());
        }
        if (beacon.altId_ && !seen.insert(*beacon.altId_).second) {
            throw InvalidConfiguration("duplicate beacon " + beacon.altId_->key());
        }
    }
}

void validate(const RuntimeConfig& runtime) {
    validate(runtime.mqtt);
    validate(runtime.kalman);
    validate(runtime.distance);
    validate(runtime.resolver);
    validate(runtime.tracker);
}

std::string expandTopicPattern(const MqttServerConfig& mqtt) {
    static const std::string placeholder = "{ApplicationID}";
    std::string topic = mqtt.topicPattern;
    size_t pos = 0;
    while ((pos = topic.find(placeholder, pos)) != std::string::npos) {
        topic.replace(pos, placeholder.size(), mqtt.applicationID);
        pos += mqtt.applicationID.size();
    }
    return topic;
}

ConfigReader::ConfigReader(const std::string &filePath)
    : filePath_(filePath) {}

std::string ConfigReader::readFile() const {
    std::ifstream file(filePath_);
    if (!file.is_open()) {
        throw InvalidConfiguration("Cannot open configuration file: " + filePath_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

SiteConfig ConfigReader::readSite() const {
    return parseSite(readFile());
}

RuntimeConfig ConfigReader::readRuntime() const {
    return parseRuntime(readFile());
}

std::vector<BLEBeacon> ConfigReader::readBeacons() const {
    return readSite().beacons;
}

SiteConfig ConfigReader::parseSite(const std::string& jsonText) {
    json document = parseDocument(jsonText);
    SiteConfig site;

    try {
        // "map" принадлежит редактору карты, здесь не нужен
        if (auto beacons = findField(document, {"beacons"})) {
            if (!beacons->is_array()) {
                throw InvalidConfiguration("beacons must be an array");
            }
            for (size_t i = 0; i < beacons->size(); ++i) {
                site.beacons.push_back(parseBeacon((*beacons)[i], i));
            }
        }
        if (auto settings = findField(document, {"settings"})) {
            readInto(*settings, "signalPropagationFactor", site.settings.signalPropagationFactor);
        }
    } catch (const json::exception& e) {
        throw InvalidConfiguration(std::string("site configuration: ") + e.what());
    }

    validate(site);
    return site;
}

RuntimeConfig ConfigReader::parseRuntime(const std::string& jsonText) {
    json document = parseDocument(jsonText);
    RuntimeConfig runtime;

    try {
        const json* mqtt = findField(document, {"mqtt"});
        if (!mqtt) {
            throw InvalidConfiguration("runtime configuration: missing 'mqtt' section");
        }
        runtime.mqtt = parseMqtt(*mqtt);

        if (auto kalman = findField(document, {"kalman"})) {
            readInto(*kalman, "processVariance", runtime.kalman.processVariance);
            readInto(*kalman, "measurementVariance", runtime.kalman.measurementVariance);
            if (auto model = optionalField<std::string>(*kalman, {"motionModel"})) {
                runtime.kalman.motionModel = parseMotionModel(*model);
            }
        }

        if (auto distance = findField(document, {"distance"})) {
            readInto(*distance, "minDistance", runtime.distance.minDistance);
            readInto(*distance, "maxDistance", runtime.distance.maxDistance);
            readInto(*distance, "weightEpsilon", runtime.distance.weightEpsilon);
        }

        if (auto resolver = findField(document, {"resolver"})) {
            readInto(*resolver, "refine", runtime.resolver.refine);
            readInto(*resolver, "residualScale", runtime.resolver.residualScale);
            readInto(*resolver, "degenerateThreshold", runtime.resolver.degenerateThreshold);
        }

        if (auto tracker = findField(document, {"tracker"})) {
            readCount(*tracker, "historyCapacity", runtime.tracker.historyCapacity);
            readInto(*tracker, "staleAfterMs", runtime.tracker.staleAfterMs);
            readInto(*tracker, "hardResetAfterMs", runtime.tracker.hardResetAfterMs);
            readCount(*tracker, "queueCapacity", runtime.tracker.queueCapacity);
            readCount(*tracker, "workerThreads", runtime.tracker.workerThreads);
            if (auto policy = optionalField<std::string>(*tracker, {"overflowPolicy"})) {
                runtime.tracker.overflowPolicy = parseOverflowPolicy(*policy);
            }
        }
    } catch (const json::exception& e) {
        throw InvalidConfiguration(std::string("runtime configuration: ") + e.what());
    }

    validate(runtime);
    return runtime;
}

}  // namespace config
