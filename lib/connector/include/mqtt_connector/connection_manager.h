#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "types.h"

namespace mqtt {
    class async_client;
    class callback;
}

namespace mqtt_connector {

/**
 * @brief Соединение с брокером: подключение, подписки, публикация
 *
 * Клиент Paho пересоздается при переподключении, поэтому наружу он не
 * отдается: публикация из рабочих потоков навигатора идет через publish(),
 * который держит свою ссылку на клиент на время вызова. После успешного
 * переподключения все подписки восстанавливаются автоматически.
 */
class ConnectionManager {
public:
    ConnectionManager();
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    bool connect(const ConnectionConfig& config);
    void disconnect();

    bool isConnected() const;
    ConnectionState getConnectionState() const;

    /**
     * @brief Подписка с запоминанием для восстановления
     * @return true если брокер подтвердил подписку
     */
    bool subscribe(const std::string& topic, int qos);
    bool unsubscribe(const std::string& topic);
    std::vector<std::pair<std::string, int>> subscriptions() const;

    /**
     * @brief Публикация сообщения
     * @param wait Ждать подтверждения брокера (нельзя из callback'ов Paho)
     */
    bool publish(const Message& message, bool wait);

    void setConnectionCallback(ConnectionCallback callback);
    void setErrorCallback(ErrorCallback callback);
    void setMessageCallback(MessageCallback callback);

    // Фоновое переподключение с экспоненциальной паузой
    void setAutoReconnect(bool enable);
    unsigned reconnectAttempts() const { return reconnect_attempts_; }

    std::string getLastError() const;

    // Вызываются из callback'а Paho
    void onConnectionLost(const std::string& cause);
    void deliverMessage(const Message& message);

private:
    std::shared_ptr<mqtt::async_client> client() const;
    bool connectClient();
    void restoreSubscriptions();
    void setState(ConnectionState state);
    void reportError(const std::string& error);
    void reconnectLoop();

    mutable std::mutex client_mutex_;
    std::shared_ptr<mqtt::async_client> client_;
    std::unique_ptr<mqtt::callback> callback_;
    ConnectionConfig config_;

    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};

    mutable std::mutex subscriptions_mutex_;
    std::vector<std::pair<std::string, int>> subscriptions_;

    mutable std::mutex callbacks_mutex_;
    ConnectionCallback connection_callback_;
    ErrorCallback error_callback_;
    MessageCallback message_callback_;
    std::string last_error_;

    std::mutex reconnect_mutex_;
    std::condition_variable reconnect_cv_;
    std::thread reconnect_thread_;
    bool stop_reconnect_ = false;
    std::atomic<unsigned> reconnect_attempts_{0};
};

} // namespace mqtt_connector
