// File: main.cpp
// Description: Bootstraps configuration, storage and the compliance services,
//              then either serves the dashboard or runs a one-shot job
//              (periodic snapshot recording or retention purge).

#include "compliance/AlertGate.hpp"
#include "compliance/ComplianceReports.hpp"
#include "compliance/Config.hpp"
#include "compliance/Errors.hpp"
#include "compliance/Logger.hpp"
#include "compliance/MySqlSession.hpp"
#include "compliance/MySqlStorage.hpp"
#include "compliance/Presence.hpp"
#include "compliance/RatioCalculator.hpp"
#include "compliance/RatioMonitor.hpp"
#include "compliance/SnapshotStore.hpp"
#include "dashboard/WebServer.hpp"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr int kDefaultPort = 8080;

std::optional<long> parseArgument(const char* text) {
    char* endPtr = nullptr;
    errno = 0;
    const long value = std::strtol(text, &endPtr, 10);
    if (errno != 0 || endPtr == text || *endPtr != '\0') {
        return std::nullopt;
    }
    return value;
}

int sanitizePort(long port) {
    if (port < 1024 || port > 65535) {
        std::cerr << "Requested port " << port
                  << " is outside the permitted range (1024-65535). Using default "
                  << kDefaultPort << ".\n";
        return kDefaultPort;
    }
    return static_cast<int>(port);
}

int resolvePort(const compliance::AppConfig& config, int argc, char* argv[]) {
    int port = config.port;
    if (argc > 2) {
        if (const auto parsed = parseArgument(argv[2])) {
            port = sanitizePort(*parsed);
        } else {
            std::cerr << "Invalid command-line port; retaining previous value " << port << ".\n";
        }
    }
    return port;
}

void printUsage() {
    std::cerr << "Usage: ratiowatch [serve [port] | record [period] [--by-room] | purge [days]]\n";
}

// Periodic trigger: one automatic snapshot per age group (or per scheduled
// room) for the current date and time.
int runRecordJob(compliance::SnapshotStore& store,
                 const compliance::AppConfig& config,
                 int argc,
                 char* argv[]) {
    std::optional<compliance::SchoolPeriodId> period = config.defaultPeriod;
    bool byRoom = false;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--by-room") {
            byRoom = true;
            continue;
        }
        const auto parsed = parseArgument(argv[i]);
        if (!parsed || *parsed <= 0 || *parsed > compliance::kMaxSchoolPeriodId) {
            std::cerr << "Invalid school period id '" << arg << "'.\n";
            return 2;
        }
        period = static_cast<compliance::SchoolPeriodId>(*parsed);
    }
    if (!period) {
        std::cerr << "No school period given and RATIOWATCH_SCHOOL_PERIOD is not set.\n";
        return 2;
    }

    const compliance::Date date = compliance::Date::today();
    const compliance::TimeOfDay time = compliance::TimeOfDay::now();
    const compliance::RecordBatch batch =
        byRoom ? store.recordByRoom(*period, date, time, std::nullopt, true)
               : store.recordAll(*period, date, time, std::nullopt, true);

    compliance::Logger::instance().log("Record job finished: " + std::to_string(batch.recordedCount()) +
                                       " recorded, " + std::to_string(batch.failedCount()) +
                                       " not recorded.");
    return batch.hardFailureCount() == 0 ? 0 : 1;
}

int runPurgeJob(compliance::SnapshotStore& store,
                const compliance::AppConfig& config,
                int argc,
                char* argv[]) {
    long days = config.retentionDays;
    if (argc > 2) {
        const auto parsed = parseArgument(argv[2]);
        if (!parsed || *parsed < 0 || *parsed > compliance::kMaxRetentionDays) {
            std::cerr << "Invalid retention days '" << argv[2] << "' (expected 0-"
                      << compliance::kMaxRetentionDays << ").\n";
            return 2;
        }
        days = *parsed;
    }
    const std::size_t removed = store.deleteOlderThan(static_cast<int>(days), compliance::Date::today());
    std::cout << "Removed " << removed << " snapshots older than " << days << " days.\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string mode = argc > 1 ? argv[1] : "serve";
    if (mode != "serve" && mode != "record" && mode != "purge") {
        printUsage();
        return 2;
    }

    compliance::AppConfig config;
    try {
        config = compliance::AppConfig::fromEnvironment();
        compliance::Logger::instance().initialize(config.logFile);
    } catch (const std::exception& ex) {
        std::cerr << "Startup failed: " << ex.what() << "\n";
        return 2;
    }

    compliance::Logger::instance().log("Starting ratiowatch (" + mode + ").");

    try {
        compliance::MySqlSession session(config.database);
        compliance::MySqlSnapshotRepository repository(session);
        repository.ensureSchema();
        compliance::MySqlPresenceSource presence(session);

        compliance::PresenceCounters counters(presence, config.policy);
        compliance::RatioCalculator calculator(config.policy);
        compliance::RatioMonitor monitor(counters, calculator);
        compliance::SnapshotStore store(repository, monitor);

        if (mode == "record") {
            return runRecordJob(store, config, argc, argv);
        }
        if (mode == "purge") {
            return runPurgeJob(store, config, argc, argv);
        }

        compliance::AlertGate alerts(store);
        compliance::ComplianceReports reports(store);

        dashboard::ServerSettings settings;
        settings.defaultPeriod = config.defaultPeriod;
        settings.warningThreshold = config.warningThreshold;

        const int port = resolvePort(config, argc, argv);
        compliance::Logger::instance().log("Resolved HTTP port " + std::to_string(port) + ".");
        dashboard::WebServer server(monitor, store, alerts, reports, settings, port);
        server.run();
    } catch (const std::exception& ex) {
        compliance::Logger::instance().error(std::string("ratiowatch terminated: ") + ex.what());
        return 1;
    }

    return 0;
}
