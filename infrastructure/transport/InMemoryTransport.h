#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "layers/transport/ITransport.h"

namespace transport {

// Simulated multidrop bus. Each sent request pops the next scripted reply of
// the addressed device; the reply is handed out by the following receive().
// An empty script (or a scripted silence) makes the receive time out.
class InMemoryTransport final : public ITransport
{
public:
    void open();

    bool send(const std::vector<uint8_t>& data, std::string& error) override;
    ReceiveStatus receive(std::vector<uint8_t>& out, std::chrono::milliseconds timeout, std::string& error) override;
    void close() override;
    bool isOpen() const override;

    void scriptReply(std::uint8_t address, std::uint8_t status, const std::string& payload);
    void scriptRawReply(std::uint8_t address, std::vector<std::uint8_t> raw);
    void scriptSilence(std::uint8_t address, std::size_t count = 1);

    // Stale bytes waiting on the line before any request is sent.
    void injectLineNoise(std::vector<std::uint8_t> raw);
    void failSends(bool fail);

    std::vector<std::vector<std::uint8_t>> sentFrames() const;
    std::size_t sentCount(std::uint8_t address) const;
    std::size_t receiveCalls() const;
    std::size_t openCount() const;
    std::size_t closeCount() const;

private:
    using Reply = std::optional<std::vector<std::uint8_t>>;

    mutable std::mutex mutex_;
    std::unordered_map<std::uint8_t, std::deque<Reply>> scripts_;
    std::optional<std::vector<std::uint8_t>> pending_;
    std::vector<std::vector<std::uint8_t>> sentFrames_;
    std::unordered_map<std::uint8_t, std::size_t> sentPerAddress_;
    std::size_t receiveCalls_ = 0;
    std::size_t openCount_ = 0;
    std::size_t closeCount_ = 0;
    bool open_ = false;
    bool failSends_ = false;
};

} // namespace transport
