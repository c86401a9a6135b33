#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "layers/application/DeviceManager.h"
#include "layers/application/ScanScheduler.h"
#include "layers/application/application_layer.h"
#include "layers/config/config_layer.h"
#include "layers/logging/logging_layer.h"
#include "layers/persistence/persistence_layer.h"
#include "layers/process/process_layer.h"
#include "layers/transport/transport_layer.h"

namespace {

struct StartupOptions {
    std::string configPath = config::kDefaultConfigPath;
    std::string lockFile = process::kDefaultLockFile;
    std::string logLevel = "info";                // debug | info | warn | error
    bool showHelp = false;
};

void printUsage() {
    std::cout
        << "Usage: TempReg [options] [config]\n"
        << "Options:\n"
        << "  --config <path>                Configuration file (default: tempreg.json)\n"
        << "  --loglevel <level>             debug, info, warn or error (default: info)\n"
        << "  --lock-file <path>             Single-instance lock file (default: tempreg.lck)\n"
        << "  --help                         Show this help\n";
}

std::optional<StartupOptions> parseArgs(int argc, char* argv[], std::string& error) {
    StartupOptions options;
    bool positionalSeen = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto getValue = [&](const std::string& key) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            options.showHelp = true;
            continue;
        }
        if (arg == "--config") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.configPath = *value;
            continue;
        }
        if (arg == "--loglevel") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.logLevel = *value;
            continue;
        }
        if (arg == "--lock-file") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.lockFile = *value;
            continue;
        }
        if (!arg.empty() && arg[0] != '-' && !positionalSeen) {
            options.configPath = arg;
            positionalSeen = true;
            continue;
        }

        error = "Unknown argument: " + arg;
        return std::nullopt;
    }

    if (options.lockFile.empty()) {
        error = "--lock-file must not be empty";
        return std::nullopt;
    }

    return options;
}

std::unique_ptr<persistence::IReadingSink> makeSink(const config::AppConfig& appConfig) {
    if (appConfig.database) {
        return std::make_unique<persistence::PostgresReadingSink>(*appConfig.database);
    }
    logging::warn("No db section configured, readings are only logged");
    return std::make_unique<persistence::LogReadingSink>();
}

} // namespace

int main(int argc, char* argv[]) {
    std::string parseError;
    const auto parsed = parseArgs(argc, argv, parseError);
    if (!parsed) {
        std::cerr << parseError << "\n\n";
        printUsage();
        return 2;
    }

    const auto options = *parsed;
    if (options.showHelp) {
        printUsage();
        return 0;
    }

    logging::setLevel(logging::levelFromString(options.logLevel));

    // The watcher is live before the lock is taken so that an early SIGTERM
    // still removes the lock file. The first signal stops the scheduler and
    // main returns once the current device or record is done; a second one
    // exits immediately.
    process::LockFile lockFile(options.lockFile);
    std::mutex schedulerMutex;
    application::ScanScheduler* activeScheduler = nullptr;
    std::atomic<bool> shutdownRequested{false};
    process::SignalWatcher signalWatcher([&](int signalNumber) {
        if (shutdownRequested.exchange(true)) {
            logging::warn("Second termination signal, exiting now", {{"signal", signalNumber}});
            lockFile.release();
            std::_Exit(0);
        }
        logging::info("Termination signal received", {{"signal", signalNumber}});
        std::lock_guard<std::mutex> lock(schedulerMutex);
        if (activeScheduler != nullptr) {
            activeScheduler->requestStop();
        }
    });

    std::string error;
    if (!lockFile.acquire(error)) {
        std::cerr << error << std::endl;
        return 1;
    }

    config::AppConfig appConfig;
    if (!config::loadConfig(options.configPath, appConfig, error)) {
        std::cerr << "Failed to load config: " << error << std::endl;
        return 1;
    }

    application::DeviceManager devices;
    for (const auto address : appConfig.scanAddresses) {
        devices.addDevice(address);
    }

    transport::SerialSettings serial;
    serial.portName = appConfig.serialDevice;

    application::ScanSettings scan;
    scan.minScanDelay = std::chrono::milliseconds(static_cast<std::int64_t>(appConfig.minScanDelaySeconds * 1000.0));
    scan.numberOfScans = appConfig.numberOfScans;

    application::SessionTiming timing;
    timing.readTimeout = serial.readTimeout;

    application::SystemClock clock;
    application::DeviceSession session(clock, timing);
    application::RetryController retryController(session, clock, appConfig.maxRetries);
    auto sink = makeSink(appConfig);

    application::ScanScheduler scheduler(scan, devices, session, retryController,
                                         transport::makeSerialTransportFactory(serial), *sink, clock);

    {
        std::lock_guard<std::mutex> lock(schedulerMutex);
        activeScheduler = &scheduler;
        if (shutdownRequested) {
            scheduler.requestStop();
        }
    }

    logging::info("Started", {{"serial_device", serial.portName},
                              {"devices", devices.size()},
                              {"min_scan_delay_seconds", appConfig.minScanDelaySeconds},
                              {"number_of_scans", appConfig.numberOfScans},
                              {"max_retries", appConfig.maxRetries}});

    scheduler.run();
    {
        std::lock_guard<std::mutex> lock(schedulerMutex);
        activeScheduler = nullptr;
    }

    logging::info("Stopped", {{"completed_scans", scheduler.completedScans()}});
    lockFile.release();
    return 0;
}
