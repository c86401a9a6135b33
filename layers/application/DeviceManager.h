#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "Device.h"

namespace application {

constexpr std::size_t kMaxDevices = 32;

class DeviceManager {
public:
    // False for a duplicate address or when the device table is full.
    bool addDevice(std::uint8_t address);

    Device* find(std::uint8_t address);
    const Device* find(std::uint8_t address) const;

    const std::vector<std::uint8_t>& scanOrder() const noexcept { return scanOrder_; }
    std::size_t size() const noexcept { return scanOrder_.size(); }
    bool empty() const noexcept { return scanOrder_.empty(); }

private:
    std::map<std::uint8_t, Device> devices_;
    std::vector<std::uint8_t> scanOrder_;
};

} // namespace application
