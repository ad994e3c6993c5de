#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "types.h"

namespace mqtt_connector {

/**
 * @brief Маршрутизация входящих сообщений по фильтрам подписок
 *
 * Фильтры хранятся в порядке регистрации, сообщение получают все
 * обработчики, чей фильтр совпал с топиком (с учетом '+' и '#').
 */
class MessageHandler {
public:
    MessageHandler();
    ~MessageHandler();

    // Повторная регистрация того же фильтра заменяет обработчик
    void registerHandler(const std::string& filter, MessageCallback callback);
    void unregisterHandler(const std::string& filter);

    /**
     * @return true если сработал хотя бы один зарегистрированный фильтр;
     *         иначе сообщение уходит обработчику по умолчанию
     */
    bool handleMessage(const Message& message);

    void setDefaultHandler(MessageCallback callback);
    std::vector<std::string> getRegisteredTopics() const;
    void clearHandlers();

private:
    std::vector<std::pair<std::string, MessageCallback>> handlers_;
    MessageCallback default_handler_;
    mutable std::mutex handlers_mutex_;
};

} // namespace mqtt_connector
