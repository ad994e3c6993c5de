#pragma once

#include "message_objects/BLE.h"
#include "navigator/navigator.h"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mqtt_connector {

/**
 * @brief Сообщение не удалось разобрать в отчет трекера
 */
class ReportDecodeError : public std::runtime_error {
public:
    explicit ReportDecodeError(const std::string& what) : std::runtime_error(what) {}
};

struct DecodedReport {
    message_objects::TrackerReport report;
    std::vector<std::string> droppedEntries;  ///< причины отброшенных записей маяков
};

/**
 * @brief JSON <-> объекты ядра
 *
 * Здесь единственное место, где разбираются псевдонимы полей
 * (macAddress/deviceId/mac, detectedBeacons/beacons, trackerId/devEui).
 */
class ReportCodec {
public:
    /**
     * @param topicFilter Фильтр подписки; идентификатор трекера берется из уровня
     *        первого '+' если в payload его нет
     */
    explicit ReportCodec(std::string topicFilter = std::string());

    /**
     * @throws ReportDecodeError если payload не JSON или нет обязательных полей
     */
    DecodedReport decode(const std::string& payload, const std::string& topic = std::string()) const;

    std::optional<std::string> trackerIdFromTopic(const std::string& topic) const;

    static std::string encodeState(const navigator::TrackerView& view);
    static std::string encodeSnapshot(const std::vector<navigator::TrackerView>& views);

private:
    std::string topicFilter_;
    std::optional<std::size_t> trackerLevel_;
};

} // namespace mqtt_connector
