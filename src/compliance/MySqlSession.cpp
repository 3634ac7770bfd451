// File: MySqlSession.cpp
// Description: Implements the shared MySQL connection wrapper.

#include "compliance/MySqlSession.hpp"

#include "compliance/Errors.hpp"
#include "compliance/Logger.hpp"

#include <errmsg.h>

namespace compliance {

MySqlSession::MySqlSession(const DatabaseSettings& settings)
    : m_conn(mysql_init(nullptr)) {
    if (!m_conn) {
        throw DataUnavailable("Failed to initialize MySQL handle.");
    }

    if (!mysql_real_connect(m_conn, settings.host.c_str(), settings.user.c_str(),
                            settings.password.c_str(), settings.database.c_str(), settings.port,
                            nullptr, 0)) {
        std::string message = "Failed to connect MySQL: ";
        message += mysql_error(m_conn);
        if (message.find("Access denied") != std::string::npos) {
            message += " (Hint: set RATIOWATCH_DB_PASSWORD / MYSQL_PWD env var)";
        }
        mysql_close(m_conn);
        m_conn = nullptr;
        Logger::instance().error(message);
        throw DataUnavailable(message);
    }

    Logger::instance().log("Connected to MySQL database '" + settings.database + "' on " +
                           settings.host + ":" + std::to_string(settings.port) + ".");
}

MySqlSession::~MySqlSession() {
    if (m_conn) {
        mysql_close(m_conn);
        m_conn = nullptr;
    }
}

bool MySqlSession::isDisconnectError(unsigned int err) {
    return err == CR_SERVER_GONE_ERROR || err == CR_SERVER_LOST || err == CR_CONNECTION_ERROR ||
           err == CR_CONN_HOST_ERROR;
}

void MySqlSession::runLocked(const std::string& sql, const ErrorHandler& onError) {
    if (!m_conn) {
        throw DataUnavailable("MySQL connection is not open.");
    }
    if (mysql_query(m_conn, sql.c_str()) == 0) {
        return;
    }
    const unsigned int err = mysql_errno(m_conn);
    const std::string message = mysql_error(m_conn);
    if (isDisconnectError(err)) {
        Logger::instance().error("MySQL disconnected: " + message);
        throw DataUnavailable("MySQL disconnected: " + message);
    }
    if (onError) {
        onError(err, message);
    }
    // Fallback for errors the handler does not map.
    throw StorageFailure("MySQL error " + std::to_string(err) + ": " + message);
}

std::vector<MySqlRow> MySqlSession::select(const std::string& sql, const ErrorHandler& onError) {
    std::lock_guard<std::mutex> lock(m_mutex);
    runLocked(sql, onError);

    MYSQL_RES* res = mysql_store_result(m_conn);
    if (!res) {
        const unsigned int err = mysql_errno(m_conn);
        const std::string message = mysql_error(m_conn);
        if (isDisconnectError(err)) {
            throw DataUnavailable("MySQL disconnected: " + message);
        }
        if (onError) {
            onError(err, message);
        }
        throw StorageFailure("MySQL returned no result set: " + message);
    }

    const unsigned int fieldCount = mysql_num_fields(res);
    std::vector<MySqlRow> rows;
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        MySqlRow values;
        values.reserve(fieldCount);
        for (unsigned int i = 0; i < fieldCount; ++i) {
            if (row[i]) {
                values.emplace_back(std::string(row[i]));
            } else {
                values.emplace_back(std::nullopt);
            }
        }
        rows.push_back(std::move(values));
    }
    mysql_free_result(res);
    return rows;
}

MySqlSession::ExecResult MySqlSession::execute(const std::string& sql, const ErrorHandler& onError) {
    std::lock_guard<std::mutex> lock(m_mutex);
    runLocked(sql, onError);
    ExecResult result;
    result.affectedRows = mysql_affected_rows(m_conn);
    result.insertId = mysql_insert_id(m_conn);
    return result;
}

std::string MySqlSession::escape(const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_conn) {
        throw DataUnavailable("MySQL connection is not open.");
    }
    std::string out;
    out.resize(value.size() * 2 + 1);
    const unsigned long len =
        mysql_real_escape_string(m_conn, &out[0], value.c_str(),
                                 static_cast<unsigned long>(value.size()));
    out.resize(len);
    return out;
}

std::string MySqlSession::quote(const std::string& value) {
    return "'" + escape(value) + "'";
}

std::string MySqlSession::quoteOrNull(const std::optional<std::string>& value) {
    return value ? quote(*value) : std::string("NULL");
}

}  // namespace compliance
