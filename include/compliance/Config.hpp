// File: Config.hpp
// Description: Declares the process configuration read once from the
//              environment at startup.

#pragma once

#include "compliance/Presence.hpp"
#include "compliance/RatioPolicy.hpp"

#include <functional>
#include <optional>
#include <string>

namespace compliance {

// Shared bounds for values accepted from the environment, the command line
// and dashboard parameters.
constexpr long kMaxSchoolPeriodId = 2147483647L;
constexpr long kMaxRetentionDays = 36500L;

struct DatabaseSettings {
    std::string host{"localhost"};
    unsigned int port{3306U};
    std::string user{"root"};
    std::string password;
    std::string database{"gibbon"};
};

struct AppConfig {
    DatabaseSettings database;
    RatioPolicy policy{RatioPolicy::quebecDefaults()};
    std::optional<SchoolPeriodId> defaultPeriod;
    double warningThreshold{90.0};
    int retentionDays{365};
    int port{8080};
    std::string logFile{"logs/ratiowatch.log"};

    // Reads RATIOWATCH_* variables through lookup (std::getenv by default).
    // Throws InvalidParameters for malformed values.
    using EnvLookup = std::function<const char*(const char*)>;
    static AppConfig fromEnvironment(const EnvLookup& lookup = EnvLookup());
};

}  // namespace compliance
