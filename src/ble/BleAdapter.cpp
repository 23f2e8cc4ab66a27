#include "ble/BleAdapter.hpp"
#include "app/Errors.hpp"
#include <regex>

bool deviceMatches(const DeviceHandle& device, const std::string& pattern) {
    if (pattern.empty()) return true;
    std::regex re;
    try {
        re = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw ConfigurationError("invalid ble.target_pattern '" + pattern + "': " + e.what());
    }
    return std::regex_search(device.name, re) || std::regex_search(device.address, re);
}
