#pragma once

#include "config/config.h"
#include "message_objects/BLE.h"
#include "navigator/beacon_registry.h"
#include "navigator/distance_estimator.h"
#include "navigator/errors.h"
#include "navigator/kalman_filter.h"
#include "navigator/position_resolver.h"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace navigator {

struct Position {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Position& other) const { return x == other.x && y == other.y; }
};

/**
 * @brief Ограниченный след позиций, старые вытесняются первыми (FIFO)
 */
class PositionHistory {
public:
    explicit PositionHistory(std::size_t capacity = 100);

    void push(const message_objects::PositionSample& sample);

    std::size_t size() const { return samples_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return samples_.empty(); }

    const std::deque<message_objects::PositionSample>& samples() const { return samples_; }
    std::vector<message_objects::PositionSample> toVector() const;

    bool operator==(const PositionHistory& other) const {
        return capacity_ == other.capacity_ && samples_ == other.samples_;
    }

private:
    std::size_t capacity_;
    std::deque<message_objects::PositionSample> samples_;
};

struct TrackerCounters {
    uint64_t acceptedReports = 0;
    uint64_t fixes = 0;
    uint64_t insufficientData = 0;
    uint64_t outOfOrder = 0;
    uint64_t droppedObservations = 0;
    uint64_t resets = 0;

    bool operator==(const TrackerCounters& other) const {
        return acceptedReports == other.acceptedReports && fixes == other.fixes &&
               insufficientData == other.insufficientData && outOfOrder == other.outOfOrder &&
               droppedObservations == other.droppedObservations && resets == other.resets;
    }
};

// Опубликованное состояние трекера
struct TrackerState {
    std::string trackerId;
    std::optional<Position> position;  ///< нет до первого успешного фикса
    double vx = 0.0;                   ///< только для модели постоянной скорости
    double vy = 0.0;
    int64_t lastUpdateTime = 0;                      ///< время сервера, мс
    std::optional<int64_t> lastKnownMeasurementTime; ///< время из отчета, мс
    std::vector<message_objects::DetectedBeacon> lastDetectedBeacons;
    PositionHistory positionHistory;
    std::optional<FixMethod> lastFixMethod;
    double lastConfidence = 0.0;
    TrackerCounters counters;

    bool operator==(const TrackerState& other) const;
};

enum class TrackerStatus {
    Unknown,  ///< еще нет ни одного фикса
    Active,
    Stale     ///< давно не обновлялся, вычисляется при чтении
};

const char* toString(TrackerStatus status);

enum class UpdateResult {
    Updated,           ///< predict + update фильтра
    Initialized,       ///< первый фикс или жесткий сброс фильтра
    InsufficientData,  ///< позиция сохранена прежней
    OutOfOrder,        ///< отчет отброшен целиком
    Failed             ///< исключение при обработке, состояние не опубликовано
};

const char* toString(UpdateResult result);

struct UpdateOutcome {
    UpdateResult result = UpdateResult::InsufficientData;
    std::optional<PositionFix> fix;
    std::vector<ErrorEvent> errors;  ///< отброшенные наблюдения и прочее
};

/**
 * @brief Состояние одного трекера: фильтр Калмана, след, свежесть
 *
 * Не потокобезопасен, вызывающий сериализует обновления одного трекера.
 */
class TrackerStateMachine {
public:
    TrackerStateMachine(std::string trackerId, const config::KalmanParams& kalman,
                        const config::TrackerSettings& tracker);

    UpdateOutcome apply(const message_objects::TrackerReport& report,
                        const RegistrySnapshot& registry, const DistanceEstimator& estimator,
                        const PositionResolver& resolver, int64_t nowMs);

    const TrackerState& state() const { return state_; }
    const KalmanFilter2D& filter() const { return filter_; }

    TrackerStatus status(int64_t nowMs) const;

private:
    TrackerState state_;
    KalmanFilter2D filter_;
    config::KalmanParams kalman_;
    config::TrackerSettings tracker_;

    std::vector<RangeMeasurement> collectRanges(const message_objects::TrackerReport& report,
                                                const RegistrySnapshot& registry,
                                                const DistanceEstimator& estimator,
                                                std::vector<ErrorEvent>& errors);
};

}  // namespace navigator
