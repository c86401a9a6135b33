#include "protocol_layer.h"

#include <algorithm>
#include <cctype>

namespace protocol {

namespace {

// Bytes are read as Latin-1 code points: printable or whitespace survive, as
// does NUL. C1 controls (except NEL) and the soft hyphen are dropped.
bool isKeptCharacter(std::uint8_t byte) {
    if (byte == 0x00) {
        return true;
    }
    if (byte >= 0x80) {
        if (byte == 0x85 || byte == 0xA0) {
            return true;
        }
        return byte > 0xA0 && byte != 0xAD;
    }
    const auto c = static_cast<unsigned char>(byte);
    return std::isprint(c) != 0 || std::isspace(c) != 0;
}

} // namespace

FrameError::FrameError(FrameErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::uint8_t checksum(const std::vector<std::uint8_t>& data, std::size_t count) {
    std::uint8_t bcc = 0x00;
    const auto end = std::min(count, data.size());
    for (std::size_t i = 0; i < end; ++i) {
        bcc ^= data[i];
    }
    return bcc;
}

std::vector<std::uint8_t> encodeRequest(const std::string& command, std::uint8_t address) {
    const std::size_t frameLength = command.size() + 3; // address + ETX + BCC
    if (frameLength > kTransmitCapacity) {
        throw FrameError(FrameErrorKind::EncodingOverflow,
                         "Request of " + std::to_string(frameLength) + " bytes exceeds transmit buffer of " +
                             std::to_string(kTransmitCapacity));
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(frameLength);
    frame.push_back(static_cast<std::uint8_t>(address | kAddressMarker));

    std::uint8_t bcc = 0x00;
    for (const char c : command) {
        const auto byte = static_cast<std::uint8_t>(c);
        frame.push_back(byte);
        bcc ^= byte;
    }

    frame.push_back(kEtx);
    bcc ^= kEtx;
    frame.push_back(bcc);
    return frame;
}

DecodedResponse decodeResponse(const std::vector<std::uint8_t>& raw) {
    if (raw.empty()) {
        throw FrameError(FrameErrorKind::EmptyResponse, "No data read");
    }
    const std::size_t bodyLength = raw.size() - 1;
    if (checksum(raw, bodyLength) != raw.back()) {
        throw FrameError(FrameErrorKind::ChecksumMismatch, "BCC verification failed");
    }
    if (bodyLength == 0) {
        throw FrameError(FrameErrorKind::EmptyResponse, "Response carries no status byte");
    }

    DecodedResponse response;
    response.status = raw.front();

    const auto bodyBegin = raw.begin() + 1;
    const auto bodyEnd = raw.begin() + static_cast<std::ptrdiff_t>(bodyLength);
    const auto etx = std::find(bodyBegin, bodyEnd, kEtx);

    response.payload.reserve(static_cast<std::size_t>(etx - bodyBegin));
    for (auto it = bodyBegin; it != etx; ++it) {
        if (isKeptCharacter(*it)) {
            response.payload.push_back(static_cast<char>(*it));
        }
    }
    return response;
}

std::vector<std::uint8_t> encodeResponse(std::uint8_t status, const std::string& payload) {
    std::vector<std::uint8_t> frame;
    frame.reserve(payload.size() + 3);
    frame.push_back(status);
    frame.insert(frame.end(), payload.begin(), payload.end());
    frame.push_back(kEtx);
    frame.push_back(checksum(frame, frame.size()));
    return frame;
}

std::string frameErrorToString(FrameErrorKind kind) {
    switch (kind) {
        case FrameErrorKind::EncodingOverflow:
            return "encoding_overflow";
        case FrameErrorKind::EmptyResponse:
            return "empty_response";
        case FrameErrorKind::ChecksumMismatch:
            return "checksum_mismatch";
    }
    return "unknown";
}

} // namespace protocol
