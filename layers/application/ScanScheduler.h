#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "DeviceManager.h"
#include "application_layer.h"
#include "layers/persistence/persistence_layer.h"
#include "layers/transport/ITransport.h"

namespace application {

struct ScanSettings {
    std::chrono::milliseconds minScanDelay{std::chrono::seconds(60)};
    std::uint64_t numberOfScans = 1; // 0 = unbounded
    std::chrono::milliseconds pollInterval{250};
    std::chrono::milliseconds devicePacing{100};
};

enum class SchedulerState {
    Idle,
    Waiting,
    ScanningAddress,
    WritingResults,
    ScanComplete
};

enum class TickResult {
    BudgetExhausted,
    Waiting,
    OpenFailed,
    Stopped,
    Scanned
};

// Drives scan cycles: wait out the minimum delay, open the link, query every
// address (serial number, then measurement), persist fresh readings, close.
// The minimum-delay wait is a coarse poll, not a precise timer.
class ScanScheduler {
public:
    ScanScheduler(ScanSettings settings,
                  DeviceManager& devices,
                  const DeviceSession& session,
                  const RetryController& retryController,
                  transport::TransportFactory openTransport,
                  persistence::IReadingSink& sink,
                  Clock& clock);

    ScanScheduler(const ScanScheduler&) = delete;
    ScanScheduler& operator=(const ScanScheduler&) = delete;

    TickResult tick();

    // Ticks until requestStop(); idles once a bounded budget is spent.
    void run();

    // Safe from another thread: stops the loop and closes the active link.
    void requestStop();
    void closeActiveTransport();

    bool stopRequested() const noexcept { return stopRequested_.load(); }
    bool budgetExhausted() const noexcept;
    std::uint64_t remainingScans() const noexcept { return remainingScans_; }
    std::uint64_t completedScans() const noexcept { return completedScans_; }
    SchedulerState state() const noexcept { return state_.load(); }
    std::size_t cursor() const noexcept { return cursor_.load(); }

private:
    std::vector<std::uint8_t> scanAddresses(transport::ITransport& transport);
    void writeResults(const std::vector<std::uint8_t>& freshAddresses);

    ScanSettings settings_;
    DeviceManager& devices_;
    const DeviceSession& session_;
    const RetryController& retryController_;
    transport::TransportFactory openTransport_;
    persistence::IReadingSink& sink_;
    Clock& clock_;

    std::uint64_t remainingScans_;
    std::uint64_t completedScans_ = 0;
    std::optional<TimePoint> lastScan_;

    std::atomic<SchedulerState> state_{SchedulerState::Idle};
    std::atomic<std::size_t> cursor_{0};
    std::atomic<bool> stopRequested_{false};

    std::mutex activeMutex_;
    transport::TransportPtr active_;
};

} // namespace application
