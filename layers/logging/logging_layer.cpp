#include "logging_layer.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace logging {

namespace json = boost::json;

namespace {

std::atomic<Level> currentLevel{Level::Info};
std::mutex sinkMutex;
LineSink lineSink;

std::string toLowerAscii(const std::string& src) {
    std::string out = src;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string utcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

} // namespace

Level levelFromString(const std::string& text) {
    const auto normalized = toLowerAscii(text);
    if (normalized == "debug") {
        return Level::Debug;
    }
    if (normalized == "warn" || normalized == "warning") {
        return Level::Warn;
    }
    if (normalized == "error") {
        return Level::Error;
    }
    return Level::Info;
}

std::string levelToString(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "INFO";
}

void setLevel(Level level) { currentLevel.store(level); }

Level level() { return currentLevel.load(); }

bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(currentLevel.load());
}

void setLineSink(LineSink sink) {
    std::lock_guard<std::mutex> lock(sinkMutex);
    lineSink = std::move(sink);
}

void write(Level level, const std::string& message, json::object fields) {
    if (!enabled(level)) {
        return;
    }

    json::object record;
    record["time"] = utcTimestamp();
    record["level"] = levelToString(level);
    record["msg"] = message;
    for (auto& field : fields) {
        record[field.key()] = std::move(field.value());
    }
    const auto line = json::serialize(record);

    std::lock_guard<std::mutex> lock(sinkMutex);
    if (lineSink) {
        lineSink(line);
        return;
    }
    std::cerr << line << std::endl;
}

void debug(const std::string& message, json::object fields) { write(Level::Debug, message, std::move(fields)); }
void info(const std::string& message, json::object fields) { write(Level::Info, message, std::move(fields)); }
void warn(const std::string& message, json::object fields) { write(Level::Warn, message, std::move(fields)); }
void error(const std::string& message, json::object fields) { write(Level::Error, message, std::move(fields)); }

} // namespace logging
