#include "config_layer.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

#include "layers/logging/logging_layer.h"

namespace config {

namespace json = boost::json;

namespace {

constexpr std::size_t kMaxScanAddresses = 32;
constexpr double kMaxSeconds = 7 * 24 * 3600.0; // one week

void appendAddress(std::int64_t value, std::vector<std::uint8_t>& out) {
    if (value < 0 || value > 255) {
        logging::warn("Scan address out of range, skipped", {{"address", value}});
        return;
    }
    const auto address = static_cast<std::uint8_t>(value);
    if (std::find(out.begin(), out.end(), address) != out.end()) {
        logging::warn("Duplicate scan address, skipped", {{"address", address}});
        return;
    }
    if (out.size() >= kMaxScanAddresses) {
        logging::warn("Too many scan addresses, extra entry skipped", {{"address", address},
                                                                       {"max", kMaxScanAddresses}});
        return;
    }
    out.push_back(address);
}

bool readString(const json::object& obj, const char* key, std::string& out, std::string& error) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.at(key).is_string()) {
        error = std::string(key) + " must be string";
        return false;
    }
    out = std::string(obj.at(key).as_string().c_str());
    return true;
}

bool readUnsigned(const json::object& obj, const char* key, std::uint64_t& out, std::string& error) {
    if (!obj.contains(key)) {
        return true;
    }
    const auto& value = obj.at(key);
    if (value.is_uint64()) {
        out = value.as_uint64();
        return true;
    }
    if (!value.is_int64() || value.as_int64() < 0) {
        error = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint64_t>(value.as_int64());
    return true;
}

bool readSeconds(const json::object& obj, const char* key, double& out, std::string& error) {
    if (!obj.contains(key)) {
        return true;
    }
    const auto& value = obj.at(key);
    double seconds = 0.0;
    if (value.is_double()) {
        seconds = value.as_double();
    } else if (value.is_int64()) {
        seconds = static_cast<double>(value.as_int64());
    } else if (value.is_uint64()) {
        seconds = static_cast<double>(value.as_uint64());
    } else {
        error = std::string(key) + " must be a number";
        return false;
    }
    if (seconds < 0.0) {
        error = std::string(key) + " must be >= 0";
        return false;
    }
    if (seconds > kMaxSeconds) {
        error = std::string(key) + " must be <= " + std::to_string(static_cast<long>(kMaxSeconds));
        return false;
    }
    out = seconds;
    return true;
}

bool readAddresses(const json::object& obj, std::vector<std::uint8_t>& out, std::string& error) {
    if (!obj.contains("scan_addresses")) {
        error = "no scan addresses configured";
        return false;
    }

    const auto& value = obj.at("scan_addresses");
    out.clear();
    if (value.is_string()) {
        out = parseAddressList(std::string(value.as_string().c_str()));
    } else if (value.is_array()) {
        for (const auto& entry : value.as_array()) {
            if (entry.is_int64()) {
                appendAddress(entry.as_int64(), out);
            } else if (entry.is_uint64()) {
                appendAddress(entry.as_uint64() > 255 ? 256 : static_cast<std::int64_t>(entry.as_uint64()), out);
            } else {
                logging::warn("Scan address must be integer, skipped", {{"entry", entry}});
            }
        }
    } else {
        error = "scan_addresses must be array or string";
        return false;
    }

    if (out.empty()) {
        error = "no scan addresses configured";
        return false;
    }
    return true;
}

bool readDatabase(const json::object& obj, std::optional<persistence::DatabaseConfig>& out, std::string& error) {
    out.reset();
    if (!obj.contains("db")) {
        return true;
    }
    if (!obj.at("db").is_object()) {
        error = "db must be object";
        return false;
    }

    const auto& db = obj.at("db").as_object();
    persistence::DatabaseConfig database;
    if (!readString(db, "host", database.host, error) ||
        !readString(db, "user", database.user, error) ||
        !readString(db, "password", database.password, error) ||
        !readString(db, "name", database.name, error)) {
        error = "db." + error;
        return false;
    }
    if (database.name.empty()) {
        error = "db.name is required";
        return false;
    }
    out = database;
    return true;
}

} // namespace

std::vector<std::uint8_t> parseAddressList(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (const char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == ',' || c == ' ') {
            cleaned.push_back(c);
        }
    }

    std::vector<std::uint8_t> addresses;
    std::istringstream parts(cleaned);
    std::string part;
    while (std::getline(parts, part, ',')) {
        const auto first = part.find_first_not_of(' ');
        if (first == std::string::npos) {
            continue;
        }
        part = part.substr(first, part.find_last_not_of(' ') - first + 1);
        if (part.find(' ') != std::string::npos) {
            logging::warn("Malformed scan address, skipped", {{"address", part}});
            continue;
        }
        if (part.size() > 3) {
            logging::warn("Scan address out of range, skipped", {{"address", part}});
            continue;
        }
        appendAddress(std::stoll(part), addresses);
    }
    return addresses;
}

bool parseConfig(const json::value& root, AppConfig& out, std::string& error) {
    if (!root.is_object()) {
        error = "Configuration must be object";
        return false;
    }
    const auto& obj = root.as_object();

    AppConfig parsed;
    if (!readString(obj, "serial_device", parsed.serialDevice, error) ||
        !readAddresses(obj, parsed.scanAddresses, error) ||
        !readSeconds(obj, "min_scan_delay_seconds", parsed.minScanDelaySeconds, error) ||
        !readUnsigned(obj, "number_of_scans", parsed.numberOfScans, error) ||
        !readDatabase(obj, parsed.database, error)) {
        return false;
    }

    std::uint64_t maxRetries = parsed.maxRetries;
    if (!readUnsigned(obj, "max_retries", maxRetries, error)) {
        return false;
    }
    if (maxRetries == 0) {
        error = "max_retries must be >= 1";
        return false;
    }
    parsed.maxRetries = static_cast<std::size_t>(maxRetries);

    if (parsed.serialDevice.empty()) {
        parsed.serialDevice = kDefaultSerialDevice;
    }

    out = std::move(parsed);
    return true;
}

bool parseConfigText(const std::string& text, AppConfig& out, std::string& error) {
    boost::system::error_code ec;
    const auto root = json::parse(text, ec);
    if (ec) {
        error = "Invalid JSON: " + ec.message();
        return false;
    }
    return parseConfig(root, out, error);
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream file(path);
    if (!file) {
        error = "Cannot open configuration file " + path;
        return false;
    }

    std::ostringstream text;
    text << file.rdbuf();
    if (!parseConfigText(text.str(), out, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

} // namespace config
