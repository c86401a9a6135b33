#include "process_layer.h"

#include <csignal>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "layers/logging/logging_layer.h"

namespace process {

LockFile::LockFile(std::string path)
    : path_(std::move(path)) {}

LockFile::~LockFile() {
    release();
}

bool LockFile::acquire(std::string& error) {
    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        error = "Lock file " + path_ + " exists - another instance may be running";
        return false;
    }

    std::ofstream file(path_, std::ios::out | std::ios::trunc);
    if (!file) {
        error = "Failed to create lock file " + path_;
        return false;
    }
    file << "running\n";
    file.close();
    if (!file) {
        error = "Failed to write lock file " + path_;
        std::filesystem::remove(path_, ec);
        return false;
    }

    held_ = true;
    return true;
}

void LockFile::release() {
    if (!held_.exchange(false)) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        logging::warn("Failed to remove lock file", {{"path", path_}, {"error", ec.message()}});
    }
}

SignalWatcher::SignalWatcher(Handler handler)
    : signals_(ioContext_, SIGINT, SIGTERM),
      handler_(std::move(handler)) {
    arm();
    signalThread_ = std::thread([this]() { ioContext_.run(); });
}

void SignalWatcher::arm() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        if (handler_) {
            handler_(signalNumber);
        }
        ++delivered_;
        arm();
    });
}

SignalWatcher::~SignalWatcher() {
    boost::system::error_code ec;
    signals_.cancel(ec);
    ioContext_.stop();
    if (signalThread_.joinable()) {
        signalThread_.join();
    }
}

} // namespace process
