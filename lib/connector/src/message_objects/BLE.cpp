#include "message_objects/BLE.h"

#include <cctype>
#include <stdexcept>

namespace message_objects {

std::string normalizeMac(const std::string& mac) {
    std::string hex;
    hex.reserve(mac.size());
    for (char c : mac) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        } else if (c != ':' && c != '-' && c != ' ') {
            throw std::invalid_argument("Invalid MAC address: " + mac);
        }
    }

    if (hex.size() != 12) {
        throw std::invalid_argument("Invalid MAC address: " + mac);
    }

    std::string result;
    result.reserve(17);
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (i > 0) {
            result.push_back(':');
        }
        result.append(hex, i, 2);
    }
    return result;
}

BeaconId BeaconId::fromMac(const std::string& mac) {
    return BeaconId(normalizeMac(mac));
}

BeaconId BeaconId::fromIBeacon(const std::string& uuid, int major, int minor) {
    if (uuid.empty()) {
        throw std::invalid_argument("Empty iBeacon UUID");
    }
    if (major < 0 || major > 0xFFFF || minor < 0 || minor > 0xFFFF) {
        throw std::invalid_argument("iBeacon major/minor out of range for " + uuid);
    }

    // ключ собирается через '/', поэтому в UUID допустимы только hex и '-'
    std::string upper;
    upper.reserve(uuid.size());
    size_t digits = 0;
    for (char c : uuid) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            ++digits;
        } else if (c == '-') {
            upper.push_back(c);
        } else {
            throw std::invalid_argument("Invalid iBeacon UUID: " + uuid);
        }
    }
    if (digits != 32) {
        throw std::invalid_argument("Invalid iBeacon UUID: " + uuid);
    }

    return BeaconId(upper + "/" + std::to_string(major) + "/" + std::to_string(minor));
}

}  // namespace message_objects
