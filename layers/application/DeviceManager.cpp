#include "DeviceManager.h"

namespace application {

bool DeviceManager::addDevice(std::uint8_t address) {
    if (scanOrder_.size() >= kMaxDevices || devices_.count(address) != 0) {
        return false;
    }

    Device device;
    device.address = address;
    devices_.emplace(address, device);
    scanOrder_.push_back(address);
    return true;
}

Device* DeviceManager::find(std::uint8_t address) {
    auto it = devices_.find(address);
    if (it == devices_.end()) {
        return nullptr;
    }
    return &it->second;
}

const Device* DeviceManager::find(std::uint8_t address) const {
    auto it = devices_.find(address);
    if (it == devices_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace application
