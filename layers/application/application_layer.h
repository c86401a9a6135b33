#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "Device.h"
#include "layers/transport/ITransport.h"

namespace application {

constexpr std::size_t kDefaultMaxRetries = 25;

class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock final : public Clock {
public:
    TimePoint now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

enum class ErrorKind {
    None,
    EncodingOverflow,
    TransportError,
    Timeout,
    EmptyResponse,
    ChecksumMismatch,
    NegativeAcknowledge,
    UnexpectedStatus,
    RetriesExhausted
};

std::string errorKindToString(ErrorKind kind);

// success means a checksum-valid frame came back; the status byte is not judged here.
struct QueryResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::uint8_t status = 0;
    std::string payload;
};

struct SessionTiming {
    std::chrono::milliseconds settleDelay{485};
    std::chrono::milliseconds readTimeout{100};
};

class DeviceSession {
public:
    explicit DeviceSession(Clock& clock, SessionTiming timing = {});

    QueryResult query(transport::ITransport& transport, Device& device, const std::string& command) const;

    // Reads once without sending and drops whatever arrives (stale bytes or nothing).
    void flush(transport::ITransport& transport) const;

    const SessionTiming& timing() const noexcept { return timing_; }

private:
    Clock& clock_;
    SessionTiming timing_;
};

enum class CommandKind {
    SerialNumber,
    Measurement
};

std::string commandText(CommandKind kind);
std::string commandName(CommandKind kind);

// Serial number: any status but NAK. Measurement: ACK only.
bool acceptsStatus(CommandKind kind, std::uint8_t status);

enum class RetryState {
    Attempting,
    Succeeded,
    NAKed,
    Failed,
    ExhaustedRetries
};

std::string retryStateToString(RetryState state);

struct RetryOutcome {
    RetryState state = RetryState::Attempting;
    std::size_t attempts = 0;
    QueryResult last;

    bool succeeded() const noexcept { return state == RetryState::Succeeded; }
};

class RetryController {
public:
    RetryController(const DeviceSession& session, Clock& clock, std::size_t maxRetries = kDefaultMaxRetries);

    // On success stores the serial number, or the value plus timestamp, on the device.
    // Any other outcome leaves the reading fields untouched.
    RetryOutcome run(transport::ITransport& transport, Device& device, CommandKind kind) const;

    std::size_t maxRetries() const noexcept { return maxRetries_; }

private:
    const DeviceSession& session_;
    Clock& clock_;
    std::size_t maxRetries_;
};

} // namespace application
