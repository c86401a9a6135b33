#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace protocol {

constexpr std::uint8_t kAck = 0x06;
constexpr std::uint8_t kNak = 0x15;
constexpr std::uint8_t kEtx = 0x03;
constexpr std::uint8_t kAddressMarker = 0x80;

constexpr std::size_t kTransmitCapacity = 2200;
constexpr std::size_t kReceiveCapacity = 255;

enum class FrameErrorKind {
    EncodingOverflow,
    EmptyResponse,
    ChecksumMismatch
};

class FrameError : public std::runtime_error {
public:
    FrameError(FrameErrorKind kind, const std::string& message);

    FrameErrorKind kind() const noexcept { return kind_; }

private:
    FrameErrorKind kind_;
};

struct DecodedResponse {
    std::uint8_t status = 0;
    std::string payload;
};

// XOR of all bytes (BCC)
std::uint8_t checksum(const std::vector<std::uint8_t>& data, std::size_t count);

// address|0x80, command, ETX, BCC(command + ETX)
std::vector<std::uint8_t> encodeRequest(const std::string& command, std::uint8_t address);

// Validates the trailing BCC, strips it, cuts the body at ETX and keeps only
// printable characters (Latin-1), whitespace and NUL of the payload.
DecodedResponse decodeResponse(const std::vector<std::uint8_t>& raw);

// Device side of the exchange: status, payload, ETX, BCC(all preceding bytes)
std::vector<std::uint8_t> encodeResponse(std::uint8_t status, const std::string& payload);

std::string frameErrorToString(FrameErrorKind kind);

} // namespace protocol
