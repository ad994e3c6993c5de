#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace navigator {

/**
 * @brief Ошибки обработки отчета. Все восстанавливаются локально.
 */
enum class ErrorKind {
    UnknownBeacon,       ///< Маяка нет в реестре, наблюдение отброшено
    InvalidSignal,       ///< RSSI вне допустимого диапазона
    InsufficientData,    ///< Меньше 2 маяков, позиция не обновлена
    OutOfOrderReport,    ///< Отчет старше последнего принятого
    DegenerateGeometry,  ///< Коллинеарные маяки, взят центроид
    QueueOverflow,       ///< Очередь трекера переполнена
    ProcessingFailure    ///< Неожиданное исключение внутри одного отчета
};

const char* toString(ErrorKind kind);

struct ErrorEvent {
    ErrorKind kind;
    std::string trackerId;
    std::string detail;
};

using ErrorCallback = std::function<void(const ErrorEvent& event)>;

struct NavigatorStatsSnapshot {
    uint64_t reportsReceived = 0;
    uint64_t reportsProcessed = 0;
    uint64_t fixes = 0;
    uint64_t unknownBeacons = 0;
    uint64_t invalidSignals = 0;
    uint64_t insufficientData = 0;
    uint64_t outOfOrder = 0;
    uint64_t degenerateGeometry = 0;
    uint64_t queueOverflows = 0;
    uint64_t processingFailures = 0;
};

// Глобальные счетчики, пишутся из рабочих потоков
struct NavigatorStats {
    std::atomic<uint64_t> reportsReceived{0};
    std::atomic<uint64_t> reportsProcessed{0};
    std::atomic<uint64_t> fixes{0};
    std::atomic<uint64_t> unknownBeacons{0};
    std::atomic<uint64_t> invalidSignals{0};
    std::atomic<uint64_t> insufficientData{0};
    std::atomic<uint64_t> outOfOrder{0};
    std::atomic<uint64_t> degenerateGeometry{0};
    std::atomic<uint64_t> queueOverflows{0};
    std::atomic<uint64_t> processingFailures{0};

    void count(ErrorKind kind);
    NavigatorStatsSnapshot snapshot() const;
};

}  // namespace navigator
