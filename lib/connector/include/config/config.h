#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "message_objects/BLE.h"

namespace config {

/**
 * @brief Ошибка конфигурации. Бросается только при загрузке, до приема отчетов.
 */
class InvalidConfiguration : public std::runtime_error {
public:
    explicit InvalidConfiguration(const std::string& what) : std::runtime_error(what) {}
};

// Параметры распространения сигнала
struct SignalSettings {
    double signalPropagationFactor = 2.5;  ///< Показатель затухания n, 1.0..6.0
};

// Преобразование RSSI -> расстояние
struct DistanceSettings {
    double minDistance = 0.1;    ///< Нижняя граница расстояния, м
    double maxDistance = 50.0;   ///< Верхняя граница (слабые сигналы)
    double weightEpsilon = 0.1;  ///< Пол для веса 1/d^2
};

struct ResolverSettings {
    bool refine = true;                  ///< Нелинейное уточнение через Ceres
    double residualScale = 1.0;          ///< Масштаб невязки для confidence, м
    double degenerateThreshold = 1e-6;   ///< Порог обусловленности геометрии
};

enum class MotionModel {
    ConstantPosition,
    ConstantVelocity
};

struct KalmanParams {
    double processVariance = 1.0;       ///< Q
    double measurementVariance = 10.0;  ///< R
    MotionModel motionModel = MotionModel::ConstantPosition;
};

enum class OverflowPolicy {
    DropOldest,
    DropNewest
};

struct TrackerSettings {
    std::size_t historyCapacity = 100;
    int64_t staleAfterMs = 30000;
    int64_t hardResetAfterMs = 300000;
    std::size_t queueCapacity = 64;
    OverflowPolicy overflowPolicy = OverflowPolicy::DropOldest;
    unsigned workerThreads = 0;  ///< 0 = hardware_concurrency
};

struct MqttServerConfig {
    std::string brokerHost;
    int brokerPort = 1883;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::string applicationID;
    std::string topicPattern;  ///< например "/device_sensor_data/{ApplicationID}/+/+/+/+"
    std::optional<std::string> clientID;
    bool enabled = true;
    std::optional<std::string> publishTopic;  ///< куда публиковать состояние трекеров
};

// Маяки площадки + настройки сигнала
struct SiteConfig {
    std::vector<message_objects::BLEBeacon> beacons;
    SignalSettings settings;
};

struct RuntimeConfig {
    MqttServerConfig mqtt;
    KalmanParams kalman;
    DistanceSettings distance;
    ResolverSettings resolver;
    TrackerSettings tracker;
};

void validate(const SignalSettings& settings);
void validate(const DistanceSettings& settings);
void validate(const ResolverSettings& settings);
void validate(const KalmanParams& params);
void validate(const TrackerSettings& settings);
void validate(const MqttServerConfig& mqtt);
void validate(const SiteConfig& site);
void validate(const RuntimeConfig& runtime);

/**
 * @brief Подставляет ApplicationID в шаблон топика
 */
std::string expandTopicPattern(const MqttServerConfig& mqtt);

class ConfigReader {
public:
    explicit ConfigReader(const std::string &filePath);

    // Читает JSON площадки (маяки + settings) и проверяет его
    SiteConfig readSite() const;

    // Читает JSON рантайма (mqtt, kalman, ...) и проверяет его
    RuntimeConfig readRuntime() const;

    std::vector<message_objects::BLEBeacon> readBeacons() const;

    static SiteConfig parseSite(const std::string& jsonText);
    static RuntimeConfig parseRuntime(const std::string& jsonText);

private:
    std::string filePath_;

    std::string readFile() const;
};

}  // namespace config
