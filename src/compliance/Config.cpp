// File: Config.cpp
// Description: Implements environment-driven configuration loading.

#include "compliance/Config.hpp"

#include "compliance/Errors.hpp"

#include <cstdlib>
#include <string>

namespace compliance {

namespace {

long parseInteger(const char* name, const std::string& value, long minimum, long maximum) {
    std::size_t consumed = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw InvalidParameters(std::string(name) + " must be an integer, got '" + value + "'.");
    }
    if (consumed != value.size() || parsed < minimum || parsed > maximum) {
        throw InvalidParameters(std::string(name) + " must be between " + std::to_string(minimum) +
                                " and " + std::to_string(maximum) + ", got '" + value + "'.");
    }
    return parsed;
}

}  // namespace

AppConfig AppConfig::fromEnvironment(const EnvLookup& lookup) {
    const EnvLookup env = lookup ? lookup : EnvLookup([](const char* key) { return std::getenv(key); });

    AppConfig config;

    if (const char* host = env("RATIOWATCH_DB_HOST")) {
        config.database.host = host;
    }
    if (const char* user = env("RATIOWATCH_DB_USER")) {
        config.database.user = user;
    }
    const char* password = env("RATIOWATCH_DB_PASSWORD");
    if (!password) {
        // Common MySQL env var name used by CLI/tools.
        password = env("MYSQL_PWD");
    }
    if (password) {
        config.database.password = password;
    }
    if (const char* db = env("RATIOWATCH_DB_NAME")) {
        config.database.database = db;
    }
    if (const char* port = env("RATIOWATCH_DB_PORT")) {
        config.database.port =
            static_cast<unsigned int>(parseInteger("RATIOWATCH_DB_PORT", port, 1, 65535));
    }

    if (const char* policy = env("RATIOWATCH_RATIO_POLICY")) {
        config.policy = RatioPolicy::parse(policy);
    }
    if (const char* period = env("RATIOWATCH_SCHOOL_PERIOD")) {
        config.defaultPeriod =
            static_cast<SchoolPeriodId>(parseInteger("RATIOWATCH_SCHOOL_PERIOD", period, 1, kMaxSchoolPeriodId));
    }
    if (const char* threshold = env("RATIOWATCH_WARNING_THRESHOLD")) {
        config.warningThreshold =
            static_cast<double>(parseInteger("RATIOWATCH_WARNING_THRESHOLD", threshold, 0, 1000));
    }
    if (const char* days = env("RATIOWATCH_RETENTION_DAYS")) {
        config.retentionDays = static_cast<int>(parseInteger("RATIOWATCH_RETENTION_DAYS", days, 0, kMaxRetentionDays));
    }
    if (const char* port = env("RATIOWATCH_PORT")) {
        config.port = static_cast<int>(parseInteger("RATIOWATCH_PORT", port, 1024, 65535));
    }
    if (const char* logFile = env("RATIOWATCH_LOG_FILE")) {
        config.logFile = logFile;
    }
    return config;
}

}  // namespace compliance
