#include "mqtt_connector/types.h"

namespace mqtt_connector {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED:
            return "Disconnected";
        case ConnectionState::CONNECTING:
            return "Connecting";
        case ConnectionState::CONNECTED:
            return "Connected";
        case ConnectionState::RECONNECTING:
            return "Reconnecting";
        case ConnectionState::FAILED:
            return "Failed";
    }
    return "Unknown";
}

std::vector<std::string> splitTopic(const std::string& topic) {
    std::vector<std::string> levels;
    std::string::size_type start = 0;
    while (true) {
        auto slash = topic.find('/', start);
        if (slash == std::string::npos) {
            levels.push_back(topic.substr(start));
            break;
        }
        levels.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }
    return levels;
}

bool topicMatches(const std::string& filter, const std::string& topic) {
    auto filterLevels = splitTopic(filter);
    auto topicLevels = splitTopic(topic);

    for (size_t i = 0; i < filterLevels.size(); ++i) {
        if (filterLevels[i] == "#")
            return true;
        if (i >= topicLevels.size())
            return false;
        if (filterLevels[i] != "+" && filterLevels[i] != topicLevels[i])
            return false;
    }
    return filterLevels.size() == topicLevels.size();
}

} // namespace mqtt_connector
