#include "ScanScheduler.h"

#include <string>
#include <utility>

#include "layers/logging/logging_layer.h"

namespace application {

namespace {

void logCommandFailure(const Device& device, CommandKind kind, const RetryOutcome& outcome) {
    const auto error = outcome.state == RetryState::ExhaustedRetries ? ErrorKind::RetriesExhausted : outcome.last.error;
    logging::warn(commandName(kind) + " failed", {{"address", device.address},
                                                  {"error", errorKindToString(error)},
                                                  {"last_error", outcome.last.message},
                                                  {"attempts", outcome.attempts}});
}

} // namespace

ScanScheduler::ScanScheduler(ScanSettings settings,
                             DeviceManager& devices,
                             const DeviceSession& session,
                             const RetryController& retryController,
                             transport::TransportFactory openTransport,
                             persistence::IReadingSink& sink,
                             Clock& clock)
    : settings_(settings),
      devices_(devices),
      session_(session),
      retryController_(retryController),
      openTransport_(std::move(openTransport)),
      sink_(sink),
      clock_(clock),
      remainingScans_(settings.numberOfScans) {}

bool ScanScheduler::budgetExhausted() const noexcept {
    return settings_.numberOfScans != 0 && remainingScans_ == 0;
}

TickResult ScanScheduler::tick() {
    if (stopRequested_) {
        return TickResult::Stopped;
    }

    if (budgetExhausted()) {
        state_ = SchedulerState::Idle;
        clock_.sleepFor(settings_.pollInterval);
        return TickResult::BudgetExhausted;
    }

    if (lastScan_ && clock_.now() - *lastScan_ < settings_.minScanDelay) {
        state_ = SchedulerState::Waiting;
        clock_.sleepFor(settings_.pollInterval);
        return TickResult::Waiting;
    }

    std::string error;
    auto transport = openTransport_ ? openTransport_(error) : nullptr;
    if (!transport) {
        logging::error("Failed to open port", {{"error", error}});
        state_ = SchedulerState::Idle;
        clock_.sleepFor(settings_.pollInterval);
        return TickResult::OpenFailed;
    }

    {
        std::lock_guard<std::mutex> lock(activeMutex_);
        active_ = transport;
    }
    if (stopRequested_) {
        // The stop raced with the open; make sure the fresh link is not left behind.
        closeActiveTransport();
        return TickResult::Stopped;
    }

    if (settings_.numberOfScans != 0) {
        --remainingScans_;
    }

    logging::debug("Scan started", {{"devices", devices_.size()}, {"remaining", remainingScans_}});
    session_.flush(*transport);

    const auto fresh = scanAddresses(*transport);
    if (!stopRequested_) {
        writeResults(fresh);
    }

    closeActiveTransport();
    lastScan_ = clock_.now();
    ++completedScans_;
    state_ = SchedulerState::ScanComplete;
    logging::debug("Scan complete", {{"fresh_readings", fresh.size()}, {"completed", completedScans_}});
    return TickResult::Scanned;
}

void ScanScheduler::run() {
    while (!stopRequested_) {
        tick();
    }
}

void ScanScheduler::requestStop() {
    stopRequested_ = true;
    closeActiveTransport();
}

void ScanScheduler::closeActiveTransport() {
    transport::TransportPtr transport;
    {
        std::lock_guard<std::mutex> lock(activeMutex_);
        transport = std::move(active_);
        active_.reset();
    }
    if (transport) {
        transport->close();
    }
}

std::vector<std::uint8_t> ScanScheduler::scanAddresses(transport::ITransport& transport) {
    std::vector<std::uint8_t> fresh;
    const auto& order = devices_.scanOrder();

    for (std::size_t i = 0; i < order.size(); ++i) {
        if (stopRequested_) {
            break;
        }

        state_ = SchedulerState::ScanningAddress;
        cursor_ = i;
        Device* device = devices_.find(order[i]);
        if (device == nullptr) {
            continue;
        }

        session_.flush(transport);

        const auto serial = retryController_.run(transport, *device, CommandKind::SerialNumber);
        if (!serial.succeeded()) {
            logCommandFailure(*device, CommandKind::SerialNumber, serial);
            clock_.sleepFor(settings_.devicePacing);
            continue;
        }

        const auto measurement = retryController_.run(transport, *device, CommandKind::Measurement);
        if (measurement.succeeded()) {
            fresh.push_back(device->address);
        } else {
            logCommandFailure(*device, CommandKind::Measurement, measurement);
        }

        clock_.sleepFor(settings_.devicePacing);
    }
    return fresh;
}

void ScanScheduler::writeResults(const std::vector<std::uint8_t>& freshAddresses) {
    state_ = SchedulerState::WritingResults;
    for (const auto address : freshAddresses) {
        if (stopRequested_) {
            logging::info("Stop requested, remaining readings not written",
                          {{"address", address}});
            break;
        }
        const Device* device = devices_.find(address);
        if (device == nullptr) {
            continue;
        }

        const auto status = sink_.record(device->serialNumber, device->value, device->timestamp);
        if (status != persistence::RecordStatus::Ok) {
            logging::warn("database write failed", {{"address", address},
                                                    {"serial", device->serialNumber},
                                                    {"status", static_cast<int>(status)},
                                                    {"reason", persistence::recordStatusToString(status)}});
        }
    }
}

} // namespace application
