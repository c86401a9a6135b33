#include "InMemoryTransport.h"

#include <utility>

#include "layers/protocol/protocol_layer.h"

namespace transport {

void InMemoryTransport::open()
{
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    ++openCount_;
}

bool InMemoryTransport::send(const std::vector<uint8_t>& data, std::string& error)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        error = "Cannot send: bus is closed";
        return false;
    }
    if (failSends_) {
        error = "Write failed: simulated line fault";
        return false;
    }
    if (data.empty()) {
        error = "Cannot send an empty frame";
        return false;
    }

    sentFrames_.push_back(data);
    const auto address = static_cast<std::uint8_t>(data.front() & ~protocol::kAddressMarker);
    ++sentPerAddress_[address];

    // A new request replaces whatever was still waiting on the line.
    pending_.reset();
    auto it = scripts_.find(address);
    if (it != scripts_.end() && !it->second.empty()) {
        pending_ = std::move(it->second.front());
        it->second.pop_front();
    }
    return true;
}

ReceiveStatus InMemoryTransport::receive(std::vector<uint8_t>& out, std::chrono::milliseconds timeout, std::string& error)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++receiveCalls_;
    out.clear();
    if (!open_) {
        error = "Cannot receive: bus is closed";
        return ReceiveStatus::Error;
    }
    if (!pending_) {
        error = "Read timeout after " + std::to_string(timeout.count()) + " ms";
        return ReceiveStatus::Timeout;
    }

    out = std::move(*pending_);
    pending_.reset();
    return ReceiveStatus::Ok;
}

void InMemoryTransport::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return;
    }
    open_ = false;
    pending_.reset();
    ++closeCount_;
}

bool InMemoryTransport::isOpen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void InMemoryTransport::scriptReply(std::uint8_t address, std::uint8_t status, const std::string& payload)
{
    scriptRawReply(address, protocol::encodeResponse(status, payload));
}

void InMemoryTransport::scriptRawReply(std::uint8_t address, std::vector<std::uint8_t> raw)
{
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_[address].emplace_back(std::move(raw));
}

void InMemoryTransport::scriptSilence(std::uint8_t address, std::size_t count)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < count; ++i) {
        scripts_[address].emplace_back(std::nullopt);
    }
}

void InMemoryTransport::injectLineNoise(std::vector<std::uint8_t> raw)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = std::move(raw);
}

void InMemoryTransport::failSends(bool fail)
{
    std::lock_guard<std::mutex> lock(mutex_);
    failSends_ = fail;
}

std::vector<std::vector<std::uint8_t>> InMemoryTransport::sentFrames() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sentFrames_;
}

std::size_t InMemoryTransport::sentCount(std::uint8_t address) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sentPerAddress_.find(address);
    return it == sentPerAddress_.end() ? 0 : it->second;
}

std::size_t InMemoryTransport::receiveCalls() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return receiveCalls_;
}

std::size_t InMemoryTransport::openCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return openCount_;
}

std::size_t InMemoryTransport::closeCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closeCount_;
}

} // namespace transport
