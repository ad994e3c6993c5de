#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace message_objects {

    /**
     * @brief Каноническая идентичность маяка
     *
     * MAC хранится в верхнем регистре через ':', iBeacon как UUID/major/minor.
     * Все псевдонимы (deviceId, macAddress, ...) сводятся к этому ключу на входе.
     */
    class BeaconId {
    public:
        BeaconId() = default;

        static BeaconId fromMac(const std::string& mac);
        static BeaconId fromIBeacon(const std::string& uuid, int major, int minor);

        const std::string& key() const { return key_; }
        bool empty() const { return key_.empty(); }

        bool operator==(const BeaconId& other) const { return key_ == other.key_; }
        bool operator!=(const BeaconId& other) const { return key_ != other.key_; }
        bool operator<(const BeaconId& other) const { return key_ < other.key_; }

    private:
        explicit BeaconId(std::string key) : key_(std::move(key)) {}

        std::string key_;
    };

    struct BeaconIdHash {
        std::size_t operator()(const BeaconId& id) const {
            return std::hash<std::string>()(id.key());
        }
    };

    // Маяк с известными координатами (метры)
    struct BLEBeacon {
        BeaconId id_;
        std::optional<BeaconId> altId_;  // MAC у маяка, заданного через UUID
        std::optional<std::string> name_;
        double x_ = 0.0;
        double y_ = 0.0;
        int txPower_ = -59;  // RSSI на 1 м
    };

    // Одно наблюдение маяка трекером
    struct DetectedBeacon {
        BeaconId id_;
        int rssi_ = 0;
        int64_t timestamp_ = 0;
    };

    struct TrackerReport {
        std::string trackerId_;
        int64_t timestamp_ = 0;  // unix ms, время из сообщения
        std::vector<DetectedBeacon> detectedBeacons_;
    };

    struct PositionSample {
        double x_ = 0.0;
        double y_ = 0.0;
        int64_t timestamp_ = 0;

        bool operator==(const PositionSample& other) const {
            return x_ == other.x_ && y_ == other.y_ && timestamp_ == other.timestamp_;
        }
    };

    std::string normalizeMac(const std::string& mac);

}; // namespace message_objects
