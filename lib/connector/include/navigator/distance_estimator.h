#pragma once

#include "config/config.h"
#include "message_objects/BLE.h"

#include <vector>

namespace navigator {

struct DistanceEstimate {
    double distance = 0.0;  ///< метры
    double weight = 0.0;    ///< 1 / max(distance, eps)^2
};

/**
 * @brief RSSI -> расстояние по логарифмической модели затухания
 *
 * distance = 10 ^ ((txPower - rssi) / (10 * n)), ограничено [minDistance, maxDistance].
 * Без состояния, можно звать из любых потоков.
 */
class DistanceEstimator {
public:
    explicit DistanceEstimator(const config::DistanceSettings& settings = config::DistanceSettings());

    DistanceEstimate estimateDistance(int rssi, const message_objects::BLEBeacon& beacon,
                                      double propagationFactor) const;

    // Вес для уже посчитанного расстояния
    double weightFor(double distance) const;

    // 0 и положительные значения приходят от сканеров без сигнала
    static bool isValidRssi(int rssi) { return rssi < 0 && rssi >= -127; }

    const config::DistanceSettings& settings() const { return settings_; }

private:
    config::DistanceSettings settings_;
};

// Медиана с отсевом выбросов по IQR (несколько замеров одного маяка в отчете)
double calculateMedian(std::vector<double> values);

}  // namespace navigator
