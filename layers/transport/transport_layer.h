#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/serial_port.hpp>

#include "ITransport.h"
#include "layers/protocol/protocol_layer.h"

namespace transport {

struct SerialSettings {
    std::string portName = "/dev/ttyUSB0";
    std::uint32_t baudRate = 19200;
    std::uint8_t characterSize = 8;
    std::chrono::milliseconds readTimeout{100};
};

class SerialTransport final : public ITransport {
public:
    explicit SerialTransport(const SerialSettings& settings);
    ~SerialTransport() override;

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    bool open(std::string& error);

    bool send(const std::vector<uint8_t>& data, std::string& error) override;
    ReceiveStatus receive(std::vector<uint8_t>& out, std::chrono::milliseconds timeout, std::string& error) override;
    void close() override;
    bool isOpen() const override;

    const SerialSettings& settings() const noexcept { return settings_; }

private:
    SerialSettings settings_;
    boost::asio::io_context ioContext_;
    boost::asio::serial_port port_;
    std::array<std::uint8_t, protocol::kReceiveCapacity> readBuffer_{};
    mutable std::mutex portMutex_;
    bool closed_ = true;
};

// Opens a fresh 8N1 serial link per call; returns nullptr and fills error on failure.
TransportPtr openSerialTransport(const SerialSettings& settings, std::string& error);

TransportFactory makeSerialTransportFactory(const SerialSettings& settings);

} // namespace transport
