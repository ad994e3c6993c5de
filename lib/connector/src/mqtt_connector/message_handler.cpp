#include "mqtt_connector/message_handler.h"

#include <algorithm>

namespace mqtt_connector {

MessageHandler::MessageHandler() = default;

MessageHandler::~MessageHandler() = default;

void MessageHandler::registerHandler(const std::string& filter, MessageCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [&filter](const auto& entry) { return entry.first == filter; });
    if (it != handlers_.end()) {
        it->second = std::move(callback);
    } else {
        handlers_.emplace_back(filter, std::move(callback));
    }
}

void MessageHandler::unregisterHandler(const std::string& filter) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                   [&filter](const auto& entry) { return entry.first == filter; }),
                    handlers_.end());
}

bool MessageHandler::handleMessage(const Message& message) {
    // Обработчики вызываются вне блокировки: они могут работать долго
    std::vector<MessageCallback> matched;
    MessageCallback fallback;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& [filter, callback] : handlers_) {
            if (callback && topicMatches(filter, message.topic)) {
                matched.push_back(callback);
            }
        }
        fallback = default_handler_;
    }

    for (const auto& callback : matched) {
        callback(message);
    }

    if (matched.empty() && fallback) {
        fallback(message);
    }

    return !matched.empty();
}

void MessageHandler::setDefaultHandler(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    default_handler_ = std::move(callback);
}

std::vector<std::string> MessageHandler::getRegisteredTopics() const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    std::vector<std::string> topics;
    topics.reserve(handlers_.size());

    for (const auto& [topic, _] : handlers_) {
        topics.push_back(topic);
    }

    return topics;
}

void MessageHandler::clearHandlers() {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.clear();
    default_handler_ = nullptr;
}

} // namespace mqtt_connector
