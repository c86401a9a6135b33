#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "layers/persistence/persistence_layer.h"

namespace config {

constexpr const char* kDefaultConfigPath = "tempreg.json";
constexpr const char* kDefaultSerialDevice = "/dev/ttyUSB0";

struct AppConfig {
    std::string serialDevice = kDefaultSerialDevice;
    std::vector<std::uint8_t> scanAddresses;
    double minScanDelaySeconds = 60.0; // 0 = no delay
    std::uint64_t numberOfScans = 1;   // 0 = continuous
    std::size_t maxRetries = 25;
    std::optional<persistence::DatabaseConfig> database;
};

// "1, 2,3" -> {1, 2, 3}. Characters other than digits, commas and spaces are
// dropped first; entries that are empty or above 255 are skipped with a warning.
std::vector<std::uint8_t> parseAddressList(const std::string& text);

bool parseConfig(const boost::json::value& root, AppConfig& out, std::string& error);
bool parseConfigText(const std::string& text, AppConfig& out, std::string& error);
bool loadConfig(const std::string& path, AppConfig& out, std::string& error);

} // namespace config
