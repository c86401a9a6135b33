#include "persistence_layer.h"

#include <array>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <utility>

#include <libpq-fe.h>

#include "layers/logging/logging_layer.h"

namespace persistence {

namespace {

struct ConnectionDeleter {
    void operator()(PGconn* connection) const { PQfinish(connection); }
};

struct ResultDeleter {
    void operator()(PGresult* result) const { PQclear(result); }
};

using ConnectionPtr = std::unique_ptr<PGconn, ConnectionDeleter>;
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

constexpr const char* kChannelLookup =
    "SELECT channel.id FROM channel LEFT JOIN unit ON channel.id_unit = unit.id WHERE unit.serialnumber = $1";
constexpr const char* kUpdateStatus = "UPDATE channel SET status = $1 WHERE id = $2";
constexpr const char* kInsertData = "INSERT INTO data (id_channel, datetime, value) VALUES ($1, $2, $3)";

template <std::size_t N>
ResultPtr execParams(PGconn* connection, const char* query, const std::array<const char*, N>& params) {
    return ResultPtr(PQexecParams(connection, query, static_cast<int>(N), nullptr, params.data(), nullptr, nullptr, 0));
}

bool commandOk(const ResultPtr& result) {
    return result && PQresultStatus(result.get()) == PGRES_COMMAND_OK;
}

} // namespace

std::string recordStatusToString(RecordStatus status) {
    switch (status) {
        case RecordStatus::Ok:
            return "ok";
        case RecordStatus::ConnectionFailed:
            return "connection_failed";
        case RecordStatus::LookupFailed:
            return "lookup_failed";
        case RecordStatus::UnknownDevice:
            return "unknown_device";
        case RecordStatus::StatusWriteFailed:
            return "status_write_failed";
        case RecordStatus::DataWriteFailed:
            return "data_write_failed";
    }
    return "unknown";
}

bool isDeviceStatusValue(const std::string& value) {
    return value.rfind("100001", 0) == 0 || value.rfind("100002", 0) == 0 || value.rfind("100003", 0) == 0;
}

std::string makeDatetime(TimePoint t) {
    const auto seconds = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&seconds, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

PostgresReadingSink::PostgresReadingSink(DatabaseConfig config)
    : config_(std::move(config)) {}

RecordStatus PostgresReadingSink::record(const std::string& serialNumber, const std::string& value, TimePoint observedAt) {
    const auto timeout = std::to_string(config_.connectTimeoutSeconds);
    const std::array<const char*, 7> keywords = {"host", "user", "password", "dbname", "sslmode", "connect_timeout", nullptr};
    const std::array<const char*, 7> values = {config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                                               config_.name.c_str(), "disable", timeout.c_str(), nullptr};

    ConnectionPtr connection(PQconnectdbParams(keywords.data(), values.data(), 0));
    if (!connection || PQstatus(connection.get()) != CONNECTION_OK) {
        logging::debug("database connection failed", {{"host", config_.host},
                                                      {"dbname", config_.name},
                                                      {"error", connection ? PQerrorMessage(connection.get()) : "out of memory"}});
        return RecordStatus::ConnectionFailed;
    }

    const auto lookup = execParams(connection.get(), kChannelLookup, std::array<const char*, 1>{serialNumber.c_str()});
    if (!lookup || PQresultStatus(lookup.get()) != PGRES_TUPLES_OK) {
        logging::debug("channel lookup failed", {{"serial", serialNumber},
                                                 {"error", PQerrorMessage(connection.get())}});
        return RecordStatus::LookupFailed;
    }
    if (PQntuples(lookup.get()) == 0) {
        logging::debug("no channel for serial number", {{"query", kChannelLookup}, {"serial", serialNumber}});
        return RecordStatus::UnknownDevice;
    }
    const std::string channelId = PQgetvalue(lookup.get(), 0, 0);

    if (isDeviceStatusValue(value)) {
        const auto update = execParams(connection.get(), kUpdateStatus,
                                       std::array<const char*, 2>{value.c_str(), channelId.c_str()});
        if (!commandOk(update)) {
            logging::debug("status update failed", {{"channel", channelId}, {"error", PQerrorMessage(connection.get())}});
            return RecordStatus::DataWriteFailed;
        }
        return RecordStatus::Ok;
    }

    const auto normal = execParams(connection.get(), kUpdateStatus,
                                   std::array<const char*, 2>{"normal", channelId.c_str()});
    if (!commandOk(normal)) {
        logging::debug("status update failed", {{"channel", channelId}, {"error", PQerrorMessage(connection.get())}});
        return RecordStatus::StatusWriteFailed;
    }

    const auto datetime = makeDatetime(observedAt);
    const auto insert = execParams(connection.get(), kInsertData,
                                   std::array<const char*, 3>{channelId.c_str(), datetime.c_str(), value.c_str()});
    if (!commandOk(insert)) {
        logging::debug("data insert failed", {{"query", kInsertData}, {"error", PQerrorMessage(connection.get())}});
        return RecordStatus::DataWriteFailed;
    }
    return RecordStatus::Ok;
}

RecordStatus LogReadingSink::record(const std::string& serialNumber, const std::string& value, TimePoint observedAt) {
    logging::info("reading", {{"serial", serialNumber}, {"value", value}, {"datetime", makeDatetime(observedAt)}});
    return RecordStatus::Ok;
}

} // namespace persistence
