#include "mqtt_connector/connection_manager.h"

#include <mqtt/async_client.h>
#include <mqtt/callback.h>

#include <algorithm>
#include <chrono>
#include <iostream>

namespace mqtt_connector {

namespace {

constexpr auto kSubscribeTimeout = std::chrono::seconds(10);
constexpr auto kPublishTimeout = std::chrono::seconds(10);

// События Paho пересылаются менеджеру; один объект на все пересозданные клиенты
class PahoCallback : public virtual mqtt::callback {
public:
    explicit PahoCallback(ConnectionManager* manager) : manager_(manager) {}

    void connection_lost(const std::string& cause) override {
        manager_->onConnectionLost(cause);
    }

    void message_arrived(mqtt::const_message_ptr msg) override {
        if (!msg)
            return;
        manager_->deliverMessage(Message(msg->get_topic(), msg->get_payload_str(),
                                         msg->get_qos(), msg->is_retained()));
    }

    void delivery_complete(mqtt::delivery_token_ptr) override {}

private:
    ConnectionManager* manager_;
};

}  // namespace

ConnectionManager::ConnectionManager() : callback_(std::make_unique<PahoCallback>(this)) {}

ConnectionManager::~ConnectionManager() {
    setAutoReconnect(false);
    disconnect();
}

std::shared_ptr<mqtt::async_client> ConnectionManager::client() const {
    std::lock_guard<std::mutex> lock(client_mutex_);
    return client_;
}

bool ConnectionManager::connect(const ConnectionConfig& config) {
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        config_ = config;
    }
    std::cout << "Connecting to " << config.serverUri() << " as " << config.client_id << std::endl;
    return connectClient();
}

bool ConnectionManager::connectClient() {
    ConnectionConfig config;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        config = config_;
    }

    setState(ConnectionState::CONNECTING);
    try {
        auto fresh = std::make_shared<mqtt::async_client>(config.serverUri(), config.client_id);
        fresh->set_callback(*callback_);

        mqtt::connect_options options;
        options.set_keep_alive_interval(config.keep_alive_interval);
        options.set_clean_session(config.clean_session);
        if (config.username)
            options.set_user_name(*config.username);
        if (config.password)
            options.set_password(*config.password);

        auto token = fresh->connect(options);
        token->wait_for(std::chrono::seconds(config.connection_timeout));
        if (token->get_return_code() != mqtt::ReasonCode::SUCCESS || !fresh->is_connected()) {
            reportError("Broker refused connection, code " +
                        std::to_string(static_cast<int>(token->get_return_code())));
            setState(ConnectionState::FAILED);
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(client_mutex_);
            client_ = std::move(fresh);
        }
    } catch (const mqtt::exception& e) {
        reportError("MQTT exception: " + std::string(e.what()));
        setState(ConnectionState::FAILED);
        return false;
    }

    restoreSubscriptions();
    setState(ConnectionState::CONNECTED);
    return true;
}

void ConnectionManager::disconnect() {
    std::shared_ptr<mqtt::async_client> current;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        current = std::move(client_);
    }

    if (current && current->is_connected()) {
        try {
            current->disconnect()->wait();
        } catch (const mqtt::exception& e) {
            reportError("Disconnect failed: " + std::string(e.what()));
        }
    }
    setState(ConnectionState::DISCONNECTED);
}

bool ConnectionManager::isConnected() const {
    if (state_ != ConnectionState::CONNECTED)
        return false;
    auto current = client();
    return current && current->is_connected();
}

ConnectionState ConnectionManager::getConnectionState() const {
    return state_;
}

bool ConnectionManager::subscribe(const std::string& topic, int qos) {
    auto current = client();
    if (!current || !isConnected())
        return false;

    try {
        auto token = current->subscribe(topic, qos);
        token->wait_for(kSubscribeTimeout);
        if (token->get_return_code() > mqtt::ReasonCode::GRANTED_QOS_2)
            return false;
    } catch (const mqtt::exception& e) {
        reportError("Subscribe to " + topic + " failed: " + e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [&topic](const auto& entry) { return entry.first == topic; });
    if (it == subscriptions_.end())
        subscriptions_.emplace_back(topic, qos);
    else
        it->second = qos;
    return true;
}

bool ConnectionManager::unsubscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                            [&topic](const auto& entry) { return entry.first == topic; }),
                             subscriptions_.end());
    }

    auto current = client();
    if (!current || !isConnected())
        return false;

    try {
        auto token = current->unsubscribe(topic);
        token->wait_for(kSubscribeTimeout);
        return token->get_return_code() == mqtt::ReasonCode::SUCCESS;
    } catch (const mqtt::exception& e) {
        reportError("Unsubscribe from " + topic + " failed: " + e.what());
        return false;
    }
}

std::vector<std::pair<std::string, int>> ConnectionManager::subscriptions() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_;
}

void ConnectionManager::restoreSubscriptions() {
    auto current = client();
    if (!current)
        return;

    for (const auto& [topic, qos] : subscriptions()) {
        try {
            current->subscribe(topic, qos);
        } catch (const mqtt::exception& e) {
            reportError("Restoring subscription " + topic + " failed: " + e.what());
        }
    }
}

bool ConnectionManager::publish(const Message& message, bool wait) {
    auto current = client();
    if (!current || !isConnected())
        return false;

    try {
        auto msg = mqtt::make_message(message.topic, message.payload);
        msg->set_qos(message.qos);
        msg->set_retained(message.retained);

        auto token = current->publish(msg);
        if (!wait)
            return true;
        token->wait_for(kPublishTimeout);
        return token->get_return_code() == mqtt::ReasonCode::SUCCESS;
    } catch (const mqtt::exception& e) {
        reportError("Publish to " + message.topic + " failed: " + e.what());
        return false;
    }
}

void ConnectionManager::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    connection_callback_ = std::move(callback);
}

void ConnectionManager::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    error_callback_ = std::move(callback);
}

void ConnectionManager::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    message_callback_ = std::move(callback);
}

std::string ConnectionManager::getLastError() const {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    return last_error_;
}

void ConnectionManager::onConnectionLost(const std::string& cause) {
    reportError("Connection lost: " + cause);
    setState(ConnectionState::DISCONNECTED);
    reconnect_cv_.notify_all();
}

void ConnectionManager::deliverMessage(const Message& message) {
    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = message_callback_;
    }
    if (!callback)
        return;

    // исключение не должно уйти в поток Paho
    try {
        callback(message);
    } catch (const std::exception& e) {
        reportError("Message handler failed on " + message.topic + ": " + e.what());
    }
}

void ConnectionManager::setState(ConnectionState state) {
    state_ = state;

    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = connection_callback_;
    }
    if (callback)
        callback(state);
}

void ConnectionManager::reportError(const std::string& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        last_error_ = error;
        callback = error_callback_;
    }
    if (callback)
        callback(error);
    else
        std::cerr << error << std::endl;
}

void ConnectionManager::setAutoReconnect(bool enable) {
    if (enable) {
        if (reconnect_thread_.joinable())
            return;
        {
            std::lock_guard<std::mutex> lock(reconnect_mutex_);
            stop_reconnect_ = false;
        }
        reconnect_thread_ = std::thread(&ConnectionManager::reconnectLoop, this);
        return;
    }

    if (!reconnect_thread_.joinable())
        return;
    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        stop_reconnect_ = true;
    }
    reconnect_cv_.notify_all();
    reconnect_thread_.join();
}

void ConnectionManager::reconnectLoop() {
    int minDelay;
    int maxDelay;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        minDelay = std::max(1, config_.reconnect_min_delay);
        maxDelay = std::max(minDelay, config_.reconnect_max_delay);
    }
    int delay = minDelay;

    std::unique_lock<std::mutex> lock(reconnect_mutex_);
    while (!stop_reconnect_) {
        const bool down = state_ == ConnectionState::DISCONNECTED ||
                          state_ == ConnectionState::FAILED;
        if (!down) {
            delay = minDelay;
            reconnect_cv_.wait_for(lock, std::chrono::seconds(minDelay));
            continue;
        }

        reconnect_cv_.wait_for(lock, std::chrono::seconds(delay), [this] { return stop_reconnect_; });
        if (stop_reconnect_)
            break;

        lock.unlock();
        ++reconnect_attempts_;
        setState(ConnectionState::RECONNECTING);
        const bool ok = connectClient();
        lock.lock();

        delay = ok ? minDelay : std::min(delay * 2, maxDelay);
    }
}

}  // namespace mqtt_connector
