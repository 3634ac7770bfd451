// File: MySqlSession.hpp
// Description: Declares a mutex-guarded MySQL connection shared by the
//              MySQL-backed presence source and snapshot repository.

#pragma once

#include "compliance/Config.hpp"
#include "compliance/SnapshotRows.hpp"

#include <mysql.h>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace compliance {

class MySqlSession {
public:
    // Connects immediately; throws DataUnavailable when the server cannot be
    // reached.
    explicit MySqlSession(const DatabaseSettings& settings);
    ~MySqlSession();

    MySqlSession(const MySqlSession&) = delete;
    MySqlSession& operator=(const MySqlSession&) = delete;

    struct ExecResult {
        unsigned long long affectedRows{0};
        unsigned long long insertId{0};
    };

    // The handler receives the MySQL error number and message of a failed
    // statement and may throw a more specific error; otherwise StorageFailure
    // is thrown. Disconnects become DataUnavailable before the handler runs.
    using ErrorHandler = std::function<void(unsigned int, const std::string&)>;

    std::vector<MySqlRow> select(const std::string& sql, const ErrorHandler& onError);
    ExecResult execute(const std::string& sql, const ErrorHandler& onError);

    std::string escape(const std::string& value);
    std::string quote(const std::string& value);
    std::string quoteOrNull(const std::optional<std::string>& value);

private:
    void runLocked(const std::string& sql, const ErrorHandler& onError);
    static bool isDisconnectError(unsigned int err);

    MYSQL* m_conn;
    std::mutex m_mutex;
};

}  // namespace compliance
