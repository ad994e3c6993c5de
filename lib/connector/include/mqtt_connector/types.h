#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mqtt_connector {

// Параметры подключения к брокеру, из которого приходят отчеты трекеров
struct ConnectionConfig {
    std::string broker_host = "localhost";
    int broker_port = 1883;
    std::string client_id;
    std::optional<std::string> username;
    std::optional<std::string> password;
    int keep_alive_interval = 60;   ///< с
    bool clean_session = true;
    int connection_timeout = 30;    ///< с
    bool use_ssl = false;

    int reconnect_min_delay = 1;    ///< с, первая пауза перед переподключением
    int reconnect_max_delay = 60;   ///< с, потолок экспоненциальной паузы

    std::string serverUri() const {
        return (use_ssl ? "ssl://" : "tcp://") + broker_host + ":" + std::to_string(broker_port);
    }
};

struct Message {
    std::string topic;
    std::string payload;
    int qos = 0;
    bool retained = false;

    Message() = default;
    Message(std::string topic, std::string payload, int qos = 0, bool retained = false)
        : topic(std::move(topic)), payload(std::move(payload)), qos(qos), retained(retained) {}
};

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING,
    FAILED
};

const char* toString(ConnectionState state);

/**
 * @brief Сопоставление топика с фильтром подписки
 *
 * '+' совпадает ровно с одним уровнем, '#' со всеми оставшимися.
 */
bool topicMatches(const std::string& filter, const std::string& topic);

std::vector<std::string> splitTopic(const std::string& topic);

using MessageCallback = std::function<void(const Message& message)>;
using ConnectionCallback = std::function<void(ConnectionState state)>;
using ErrorCallback = std::function<void(const std::string& error)>;

} // namespace mqtt_connector
