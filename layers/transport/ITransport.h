#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace transport {

enum class ReceiveStatus {
    Ok,
    Timeout,
    Error
};

// Half-duplex byte link: one send, then one receive, never overlapping.
class ITransport
{
public:
    virtual ~ITransport() = default;

    virtual bool send(const std::vector<uint8_t>& data, std::string& error) = 0;
    virtual ReceiveStatus receive(std::vector<uint8_t>& out, std::chrono::milliseconds timeout, std::string& error) = 0;

    // Closing twice is a no-op.
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

using TransportPtr = std::shared_ptr<ITransport>;
using TransportFactory = std::function<TransportPtr(std::string& error)>;

} // namespace transport
