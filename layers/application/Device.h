#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/json.hpp>

namespace application {

using TimePoint = std::chrono::system_clock::time_point;

struct DeviceCounters {
    std::uint64_t sent = 0;
    std::uint64_t received = 0;
    std::uint64_t nak = 0;
};

// State of one bus address. Mutated only by the session/retry calls for that address.
struct Device {
    std::uint8_t address = 0;
    std::string serialNumber;
    std::string value;
    TimePoint timestamp{};
    DeviceCounters counters;

    bool hasTimestamp() const noexcept { return timestamp != TimePoint{}; }
    boost::json::object countersToJson() const;
};

} // namespace application
