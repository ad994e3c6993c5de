#include "mqtt_connector/mqtt_client.h"

#include <iostream>
#include <sstream>

namespace mqtt_connector {

MqttClient::MqttClient(navigator::Navigator* navigator, QObject* parent)
    : QObject(parent),
      navigator_(navigator),
      connection_manager_(std::make_unique<ConnectionManager>()),
      message_handler_(std::make_unique<MessageHandler>()),
      codec_(std::make_unique<ReportCodec>()) {
    connection_manager_->setMessageCallback(
        [this](const Message& message) { message_handler_->handleMessage(message); });
    connection_manager_->setConnectionCallback([this](ConnectionState state) {
        emit setConnectStatus(QString::fromUtf8(toString(state)));
    });
    message_handler_->setDefaultHandler([](const Message& message) {
        std::cerr << "No handler for topic " << message.topic << std::endl;
    });
}

MqttClient::~MqttClient() {
    shutdown();
}

ConnectionConfig MqttClient::connectionConfigFrom(const config::MqttServerConfig& server) {
    ConnectionConfig config;
    config.broker_host = server.brokerHost;
    config.broker_port = server.brokerPort;
    config.client_id = server.clientID.value_or("beacon-tracker-" + server.applicationID);
    config.username = server.username;
    config.password = server.password;
    return config;
}

bool MqttClient::initialize(const ConnectionConfig& config, const std::string& reportTopic,
                            const std::optional<std::string>& publishTopic) {
    if (initialized_) {
        shutdown();
    }

    current_config_ = config;
    publish_topic_ = publishTopic;
    codec_ = std::make_unique<ReportCodec>(reportTopic);

    if (!connection_manager_->connect(config)) {
        return false;
    }
    initialized_ = true;

    if (!subscribe(reportTopic, 1, [this](const Message& message) { handleReport(message); })) {
        std::cerr << "Failed to subscribe to " << reportTopic << std::endl;
        shutdown();
        return false;
    }

    // состояние публикуется только после успешной подписки
    if (navigator_) {
        navigator_->setTrackerListener(
            [this](const navigator::TrackerView& view) { onTrackerUpdated(view); });
    }
    return true;
}

void MqttClient::shutdown() {
    connection_manager_->setAutoReconnect(false);
    if (navigator_) {
        navigator_->setTrackerListener(nullptr);
    }

    if (!initialized_.exchange(false)) {
        return;
    }

    for (const auto& [topic, qos] : connection_manager_->subscriptions()) {
        connection_manager_->unsubscribe(topic);
    }
    connection_manager_->disconnect();
    message_handler_->clearHandlers();
}

bool MqttClient::subscribe(const std::string& topic, int qos, MessageCallback callback) {
    if (!initialized_) {
        return false;
    }

    // обработчик регистрируется до подписки, чтобы не потерять retained сообщения
    if (callback) {
        message_handler_->registerHandler(topic, std::move(callback));
    }
    if (!connection_manager_->subscribe(topic, qos)) {
        message_handler_->unregisterHandler(topic);
        return false;
    }
    return true;
}

bool MqttClient::unsubscribe(const std::string& topic) {
    message_handler_->unregisterHandler(topic);
    return initialized_ && connection_manager_->unsubscribe(topic);
}

bool MqttClient::publish(const Message& message) {
    return initialized_ && connection_manager_->publish(message, true);
}

bool MqttClient::isConnected() const {
    return initialized_ && connection_manager_->isConnected();
}

ConnectionState MqttClient::getConnectionState() const {
    return initialized_ ? connection_manager_->getConnectionState() : ConnectionState::DISCONNECTED;
}

void MqttClient::setErrorHandler(ErrorCallback callback) {
    connection_manager_->setErrorCallback(std::move(callback));
}

void MqttClient::setAutoReconnect(bool enable) {
    connection_manager_->setAutoReconnect(enable);
}

std::string MqttClient::getStatus() const {
    std::ostringstream status;
    status << "MQTT " << toString(getConnectionState()) << " " << current_config_.serverUri()
           << " client=" << current_config_.client_id << "\n";
    for (const auto& [topic, qos] : connection_manager_->subscriptions()) {
        status << "  subscribed " << topic << " (qos " << qos << ")\n";
    }
    status << "  reconnects=" << connection_manager_->reconnectAttempts()
           << " decode_failures=" << decode_failures_
           << " publish_failures=" << publish_failures_ << "\n";

    auto lastError = connection_manager_->getLastError();
    if (!lastError.empty()) {
        status << "  last error: " << lastError << "\n";
    }
    return status.str();
}

bool MqttClient::handleReport(const Message& message) {
    if (!navigator_) {
        return false;
    }

    try {
        DecodedReport decoded = codec_->decode(message.payload, message.topic);
        for (const auto& reason : decoded.droppedEntries) {
            std::cerr << "Dropped beacon entry from " << message.topic << ": " << reason << std::endl;
        }
        return navigator_->submit(std::move(decoded.report));
    } catch (const ReportDecodeError& e) {
        ++decode_failures_;
        std::cerr << "Report decode error on " << message.topic << ": " << e.what() << std::endl;
        return false;
    }
}

void MqttClient::onTrackerUpdated(const navigator::TrackerView& view) {
    if (view.state.position) {
        emit trackerUpdated(QString::fromStdString(view.state.trackerId),
                            QPointF(view.state.position->x, view.state.position->y));
    }

    if (!publish_topic_) {
        return;
    }

    // из рабочего потока навигатора: не ждем подтверждения брокера
    Message state(*publish_topic_ + "/" + view.state.trackerId, ReportCodec::encodeState(view), 0, true);
    if (!connection_manager_->publish(state, false)) {
        ++publish_failures_;
    }
}

}  // namespace mqtt_connector
