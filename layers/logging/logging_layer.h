#pragma once

#include <functional>
#include <string>

#include <boost/json.hpp>

namespace logging {

enum class Level {
    Debug,
    Info,
    Warn,
    Error
};

using LineSink = std::function<void(const std::string&)>;

// Accepts debug|info|warn|warning|error (any case); anything else maps to Info.
Level levelFromString(const std::string& text);
std::string levelToString(Level level);

void setLevel(Level level);
Level level();
bool enabled(Level level);

// Replaces the stderr writer; pass an empty sink to restore it.
void setLineSink(LineSink sink);

// One JSON object per line: {"time","level","msg", ...fields}
void write(Level level, const std::string& message, boost::json::object fields = {});

void debug(const std::string& message, boost::json::object fields = {});
void info(const std::string& message, boost::json::object fields = {});
void warn(const std::string& message, boost::json::object fields = {});
void error(const std::string& message, boost::json::object fields = {});

} // namespace logging
