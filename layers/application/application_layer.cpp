#include "application_layer.h"

#include <thread>
#include <utility>
#include <vector>

#include "layers/logging/logging_layer.h"
#include "layers/protocol/protocol_layer.h"

namespace application {

namespace {

ErrorKind toErrorKind(protocol::FrameErrorKind kind) {
    switch (kind) {
        case protocol::FrameErrorKind::EncodingOverflow:
            return ErrorKind::EncodingOverflow;
        case protocol::FrameErrorKind::EmptyResponse:
            return ErrorKind::EmptyResponse;
        case protocol::FrameErrorKind::ChecksumMismatch:
            return ErrorKind::ChecksumMismatch;
    }
    return ErrorKind::TransportError;
}

QueryResult makeError(ErrorKind kind, std::string message) {
    QueryResult result;
    result.error = kind;
    result.message = std::move(message);
    return result;
}

} // namespace

TimePoint SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::EncodingOverflow:
            return "encoding_overflow";
        case ErrorKind::TransportError:
            return "transport_error";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::EmptyResponse:
            return "empty_response";
        case ErrorKind::ChecksumMismatch:
            return "checksum_mismatch";
        case ErrorKind::NegativeAcknowledge:
            return "negative_acknowledge";
        case ErrorKind::UnexpectedStatus:
            return "unexpected_status";
        case ErrorKind::RetriesExhausted:
            return "retries_exhausted";
    }
    return "unknown";
}

DeviceSession::DeviceSession(Clock& clock, SessionTiming timing)
    : clock_(clock), timing_(timing) {}

QueryResult DeviceSession::query(transport::ITransport& transport, Device& device, const std::string& command) const {
    logging::debug("query", {{"address", device.address}, {"command", command}});

    std::vector<std::uint8_t> request;
    try {
        request = protocol::encodeRequest(command, device.address);
    } catch (const protocol::FrameError& e) {
        return makeError(toErrorKind(e.kind()), e.what());
    }

    std::string error;
    if (!transport.send(request, error)) {
        return makeError(ErrorKind::TransportError, error);
    }
    ++device.counters.sent;

    clock_.sleepFor(timing_.settleDelay);

    std::vector<std::uint8_t> raw;
    const auto status = transport.receive(raw, timing_.readTimeout, error);
    if (status == transport::ReceiveStatus::Timeout) {
        return makeError(ErrorKind::Timeout, error);
    }
    if (status == transport::ReceiveStatus::Error) {
        return makeError(ErrorKind::TransportError, error);
    }

    protocol::DecodedResponse decoded;
    try {
        decoded = protocol::decodeResponse(raw);
    } catch (const protocol::FrameError& e) {
        return makeError(toErrorKind(e.kind()), e.what());
    }
    ++device.counters.received;

    QueryResult result;
    result.success = true;
    result.status = decoded.status;
    result.payload = std::move(decoded.payload);
    return result;
}

void DeviceSession::flush(transport::ITransport& transport) const {
    std::vector<std::uint8_t> stale;
    std::string error;
    const auto status = transport.receive(stale, timing_.readTimeout, error);
    if (status == transport::ReceiveStatus::Ok) {
        logging::debug("Dropped stale bytes", {{"bytes", stale.size()}});
    } else if (status == transport::ReceiveStatus::Error) {
        logging::debug("Dummy read error", {{"error", error}});
    }
}

std::string commandText(CommandKind kind) {
    switch (kind) {
        case CommandKind::SerialNumber:
            return "SN ?";
        case CommandKind::Measurement:
            return "MEA CH 1 ?";
    }
    return {};
}

std::string commandName(CommandKind kind) {
    return kind == CommandKind::SerialNumber ? "serial_number" : "measurement";
}

bool acceptsStatus(CommandKind kind, std::uint8_t status) {
    if (kind == CommandKind::Measurement) {
        return status == protocol::kAck;
    }
    return status != protocol::kNak;
}

std::string retryStateToString(RetryState state) {
    switch (state) {
        case RetryState::Attempting:
            return "attempting";
        case RetryState::Succeeded:
            return "succeeded";
        case RetryState::NAKed:
            return "naked";
        case RetryState::Failed:
            return "failed";
        case RetryState::ExhaustedRetries:
            return "exhausted_retries";
    }
    return "unknown";
}

RetryController::RetryController(const DeviceSession& session, Clock& clock, std::size_t maxRetries)
    : session_(session), clock_(clock), maxRetries_(maxRetries) {}

RetryOutcome RetryController::run(transport::ITransport& transport, Device& device, CommandKind kind) const {
    RetryOutcome outcome;
    const auto command = commandText(kind);

    while (outcome.attempts < maxRetries_) {
        outcome.state = RetryState::Attempting;
        ++outcome.attempts;
        outcome.last = session_.query(transport, device, command);
        auto& last = outcome.last;

        if (last.error == ErrorKind::EncodingOverflow) {
            outcome.state = RetryState::Failed;
            logging::error("Command cannot be encoded", {{"address", device.address},
                                                         {"command", command},
                                                         {"error", last.message}});
            return outcome;
        }

        if (last.success && acceptsStatus(kind, last.status)) {
            outcome.state = RetryState::Succeeded;
            if (kind == CommandKind::SerialNumber) {
                device.serialNumber = last.payload;
                logging::debug("Serial number", {{"address", device.address}, {"serial", device.serialNumber}});
            } else {
                device.value = last.payload;
                device.timestamp = clock_.now();
                auto fields = device.countersToJson();
                fields["serial"] = device.serialNumber;
                fields["value"] = device.value;
                logging::debug("Measurement", std::move(fields));
            }
            return outcome;
        }

        if (last.success && last.status == protocol::kNak) {
            outcome.state = RetryState::NAKed;
            ++device.counters.nak;
            last.success = false;
            last.error = ErrorKind::NegativeAcknowledge;
            last.message = "NAK received";
            logging::debug("NAK received", device.countersToJson());
            continue;
        }

        if (last.success) {
            last.success = false;
            last.error = ErrorKind::UnexpectedStatus;
            last.message = "Unexpected status byte " + std::to_string(last.status);
        }
        logging::debug("Attempt failed", {{"address", device.address},
                                          {"command", commandName(kind)},
                                          {"attempt", outcome.attempts},
                                          {"error", errorKindToString(last.error)},
                                          {"detail", last.message}});
    }

    outcome.state = RetryState::ExhaustedRetries;
    return outcome;
}

} // namespace application
