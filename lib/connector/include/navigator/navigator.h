#pragma once

#include "config/config.h"
#include "message_objects/BLE.h"
#include "navigator/beacon_registry.h"
#include "navigator/distance_estimator.h"
#include "navigator/errors.h"
#include "navigator/position_resolver.h"
#include "navigator/tracker_state.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace navigator {

struct NavigatorSettings {
    config::KalmanParams kalman;
    config::DistanceSettings distance;
    config::ResolverSettings resolver;
    config::TrackerSettings tracker;

    static NavigatorSettings fromRuntime(const config::RuntimeConfig& runtime);
};

// Состояние трекера + статус, вычисленный в момент чтения
struct TrackerView {
    TrackerState state;
    TrackerStatus status = TrackerStatus::Unknown;
};

using Clock = std::function<int64_t()>;
using TrackerListener = std::function<void(const TrackerView& view)>;

/**
 * @brief Координатор оценки позиций
 *
 * Отчеты разных трекеров обрабатываются параллельно пулом потоков,
 * отчеты одного трекера строго последовательно. У каждого трекера своя
 * ограниченная очередь и свой мьютекс, глобальной блокировки состояния нет.
 */
class Navigator {
   public:
    Navigator(std::shared_ptr<BeaconRegistry> registry, const NavigatorSettings& settings,
              Clock clock = &Navigator::systemClock);
    ~Navigator();

    Navigator(const Navigator&) = delete;
    Navigator& operator=(const Navigator&) = delete;

    /**
     * @brief Поставить отчет в очередь трекера
     * @return false после shutdown() или если отчет отброшен политикой DropNewest
     */
    bool submit(message_objects::TrackerReport report);

    // Синхронная обработка в вызывающем потоке
    UpdateOutcome process(const message_objects::TrackerReport& report);

    std::optional<TrackerView> trackerState(const std::string& trackerId) const;

    // Все трекеры, отсортированы по идентификатору
    std::vector<TrackerView> snapshot() const;

    void setTrackerListener(TrackerListener listener);
    void setErrorHandler(ErrorCallback handler);

    void reloadBeacons(const config::SiteConfig& site);
    BeaconRegistry& registry() { return *registry_; }

    NavigatorStatsSnapshot stats() const { return stats_.snapshot(); }

    // Ждет, пока все принятые отчеты будут обработаны
    void waitIdle();

    // Перестает принимать отчеты, дорабатывает принятые и останавливает потоки
    void shutdown();

    bool accepting() const { return accepting_; }

    static int64_t systemClock();

   private:
    struct TrackerSlot {
        TrackerSlot(const std::string& trackerId, const NavigatorSettings& settings)
            : machine(trackerId, settings.kalman, settings.tracker) {}

        std::mutex stateMutex;
        TrackerStateMachine machine;

        std::mutex queueMutex;
        std::deque<message_objects::TrackerReport> queue;
        bool scheduled = false;
    };

    std::shared_ptr<BeaconRegistry> registry_;
    NavigatorSettings settings_;
    DistanceEstimator estimator_;
    PositionResolver resolver_;
    Clock clock_;

    mutable std::shared_mutex slotsMutex_;
    std::unordered_map<std::string, std::shared_ptr<TrackerSlot>> slots_;

    // Очередь трекеров, готовых к обработке
    std::mutex runMutex_;
    std::condition_variable runCv_;
    std::condition_variable idleCv_;
    std::deque<std::shared_ptr<TrackerSlot>> runQueue_;
    std::atomic<int64_t> pending_{0};
    bool stopping_ = false;
    // submit() между проверкой stopping_ и постановкой слота в runQueue_
    int submitting_ = 0;
    std::vector<std::thread> workers_;
    std::atomic<bool> accepting_{true};

    std::mutex callbackMutex_;
    TrackerListener listener_;
    ErrorCallback errorHandler_;

    NavigatorStats stats_;

    std::shared_ptr<TrackerSlot> slotFor(const std::string& trackerId);
    std::shared_ptr<TrackerSlot> findSlot(const std::string& trackerId) const;

    UpdateOutcome processOnSlot(TrackerSlot& slot, const message_objects::TrackerReport& report);
    bool enqueue(message_objects::TrackerReport report, std::shared_ptr<TrackerSlot>& scheduled);
    void leaveSubmit(std::shared_ptr<TrackerSlot> scheduled);
    void runSlot(const std::shared_ptr<TrackerSlot>& slot);
    void workerLoop();
    void finishReport();

    void reportError(const ErrorEvent& event);
    void publish(const TrackerView& view);
};

}  // namespace navigator
