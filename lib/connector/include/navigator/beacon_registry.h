#pragma once

#include "config/config.h"
#include "message_objects/BLE.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace navigator {

/**
 * @brief Неизменяемый снимок реестра маяков
 *
 * Маяк с двумя идентичностями (UUID/major/minor и MAC) доступен по обеим.
 */
struct RegistrySnapshot {
    std::unordered_map<message_objects::BeaconId, message_objects::BLEBeacon,
                       message_objects::BeaconIdHash>
        beacons;
    std::size_t beaconCount = 0;
    double propagationFactor = 2.5;
    uint64_t generation = 0;

    const message_objects::BLEBeacon* find(const message_objects::BeaconId& id) const;
};

/**
 * @brief Реестр известных маяков
 *
 * Читатели берут снимок без блокировок, reload() подменяет указатель целиком,
 * поэтому во время перезагрузки виден либо старый, либо новый набор.
 */
class BeaconRegistry {
public:
    BeaconRegistry();
    explicit BeaconRegistry(const config::SiteConfig& site);

    BeaconRegistry(const BeaconRegistry&) = delete;
    BeaconRegistry& operator=(const BeaconRegistry&) = delete;

    std::optional<message_objects::BLEBeacon> lookup(const message_objects::BeaconId& id) const;

    /**
     * @brief Атомарная замена набора маяков
     * @throws config::InvalidConfiguration если набор некорректен
     */
    void reload(const std::vector<message_objects::BLEBeacon>& beacons,
                const config::SignalSettings& settings);
    void reload(const config::SiteConfig& site);

    std::shared_ptr<const RegistrySnapshot> snapshot() const;

    std::size_t size() const;
    double propagationFactor() const;

private:
    std::shared_ptr<const RegistrySnapshot> current_;
    std::mutex reload_mutex_;  // только между писателями
};

}  // namespace navigator
