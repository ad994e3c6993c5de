#pragma once

#include "types.h"
#include "message_handler.h"
#include "connection_manager.h"
#include "report_codec.h"
#include "config/config.h"
#include "navigator/navigator.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QObject>
#include <QPointF>
#include <QString>

namespace mqtt_connector {

/**
 * @brief MQTT клиент: принимает отчеты трекеров и отдает их навигатору
 *
 * Разбор payload делает ReportCodec, сама оценка позиции в navigator::Navigator.
 * Обновленные состояния уходят сигналом trackerUpdated и, если задан
 * publishTopic, публикуются обратно в брокер.
 */
class MqttClient : public QObject {
    Q_OBJECT

public:
    explicit MqttClient(navigator::Navigator* navigator, QObject* parent = nullptr);
    ~MqttClient() override;

    static ConnectionConfig connectionConfigFrom(const config::MqttServerConfig& server);

    /**
     * @brief Подключение и подписка на топик отчетов
     * @param config Конфигурация подключения
     * @param reportTopic Фильтр топиков отчетов, из него же берется trackerId
     * @param publishTopic Префикс для публикации состояний (нет - не публиковать)
     * @return true если подключение и подписка успешны
     */
    bool initialize(const ConnectionConfig& config, const std::string& reportTopic,
                    const std::optional<std::string>& publishTopic = std::nullopt);

    void shutdown();

    // Дополнительная подписка; callback получает сообщения по фильтру topic
    bool subscribe(const std::string& topic, int qos, MessageCallback callback);
    bool unsubscribe(const std::string& topic);

    bool publish(const Message& message);

    bool isConnected() const;
    ConnectionState getConnectionState() const;

    void setErrorHandler(ErrorCallback callback);
    void setAutoReconnect(bool enable);

    std::string getStatus() const;

    /**
     * @brief Разбор и постановка отчета в очередь навигатора
     * @return true если отчет принят
     */
    bool handleReport(const Message& message);

    uint64_t decodeFailures() const { return decode_failures_; }

    Q_SIGNALS:
    void trackerUpdated(const QString& trackerId, const QPointF& position);
    void setConnectStatus(const QString& status);

private:
    navigator::Navigator* navigator_;

    std::unique_ptr<ConnectionManager> connection_manager_;
    std::unique_ptr<MessageHandler> message_handler_;
    std::unique_ptr<ReportCodec> codec_;

    ConnectionConfig current_config_;
    std::atomic<bool> initialized_{false};
    std::optional<std::string> publish_topic_;

    std::atomic<uint64_t> decode_failures_{0};
    std::atomic<uint64_t> publish_failures_{0};

    void onTrackerUpdated(const navigator::TrackerView& view);
};

} // namespace mqtt_connector
