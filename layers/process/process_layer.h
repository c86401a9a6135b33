#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

#include <boost/asio.hpp>

namespace process {

constexpr const char* kDefaultLockFile = "tempreg.lck";

// Single-instance marker on disk. release() may be called from the signal
// thread while the owner is still alive; only the first call removes the file.
class LockFile {
public:
    explicit LockFile(std::string path);
    ~LockFile();

    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    bool acquire(std::string& error);
    void release();

    bool held() const noexcept { return held_.load(); }
    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    std::atomic<bool> held_{false};
};

class SignalWatcher {
public:
    using Handler = std::function<void(int signalNumber)>;

    // Watches SIGINT and SIGTERM on its own io_context thread. The handler
    // runs on that thread once for every delivered signal.
    explicit SignalWatcher(Handler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    std::size_t delivered() const noexcept { return delivered_.load(); }

private:
    void arm();

    boost::asio::io_context ioContext_;
    boost::asio::signal_set signals_;
    Handler handler_;
    std::atomic<std::size_t> delivered_{0};
    std::thread signalThread_;
};

} // namespace process
