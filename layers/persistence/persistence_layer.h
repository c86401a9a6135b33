#pragma once

#include <chrono>
#include <string>

namespace persistence {

using TimePoint = std::chrono::system_clock::time_point;

enum class RecordStatus : int {
    Ok = 0,
    ConnectionFailed = 1,
    LookupFailed = 2,
    UnknownDevice = 3,
    StatusWriteFailed = 4,
    DataWriteFailed = 5
};

std::string recordStatusToString(RecordStatus status);

class IReadingSink {
public:
    virtual ~IReadingSink() = default;
    virtual RecordStatus record(const std::string& serialNumber, const std::string& value, TimePoint observedAt) = 0;
};

struct DatabaseConfig {
    std::string host;
    std::string user;
    std::string password;
    std::string name;
    int connectTimeoutSeconds = 5;
};

// Values 100001..100003 are device state codes rather than measurements.
bool isDeviceStatusValue(const std::string& value);

// "YYYY-MM-DD HH:MM:SS", local time
std::string makeDatetime(TimePoint t);

// Connects per call, resolves the channel of the unit with this serial number,
// then either stores the state code on the channel or marks it normal and
// inserts the measurement row.
class PostgresReadingSink final : public IReadingSink {
public:
    explicit PostgresReadingSink(DatabaseConfig config);

    RecordStatus record(const std::string& serialNumber, const std::string& value, TimePoint observedAt) override;

private:
    DatabaseConfig config_;
};

// Used when no database is configured.
class LogReadingSink final : public IReadingSink {
public:
    RecordStatus record(const std::string& serialNumber, const std::string& value, TimePoint observedAt) override;
};

} // namespace persistence
