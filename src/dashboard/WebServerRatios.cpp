// File: WebServerRatios.cpp
// Description: Live ratio, snapshot and alert endpoints separated from core
//              WebServer routing.

#include "dashboard/WebServer.hpp"

#include "compliance/Errors.hpp"
#include "compliance/Logger.hpp"
#include "dashboard/JsonFormat.hpp"

#include <sstream>

namespace dashboard {

std::string WebServer::handleCurrentRatios(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const compliance::Date date = parseDateOr(params, "date", compliance::Date::today());
    const compliance::TimeOfDay time = parseTimeOrNow(params);

    std::ostringstream oss;
    try {
        const auto byAgeGroup = m_monitor.currentRatios(period, date, time);
        const auto byRoom = m_monitor.currentRatiosByRoom(period, date, time);
        oss << R"({"stale":false,)"
            << R"("date":)" << jsonString(date.toString()) << ","
            << R"("time":)" << jsonString(time.toString()) << ","
            << R"("ageGroups":)" << toJsonArray(byAgeGroup) << ","
            << R"("rooms":)" << toJsonArray(byRoom) << ","
            << R"("roomChildCountsExact":)"
            << (m_monitor.counters().roomChildCountingSupported() ? "true" : "false") << "}";
    } catch (const compliance::DataUnavailable& ex) {
        // Presence feed is down: serve the last recorded snapshots instead.
        compliance::Logger::instance().warn(std::string("Live ratios unavailable, serving snapshots: ") +
                                            ex.what());
        const auto latest = m_store.latestPerAgeGroup(period, date);
        oss.str(std::string());
        oss << R"({"stale":true,)"
            << R"("date":)" << jsonString(date.toString()) << ","
            << R"("reason":)" << jsonString(ex.what()) << ","
            << R"("snapshots":)" << toJson(latest) << "}";
    }
    return oss.str();
}

std::string WebServer::handleShortfall(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const compliance::Date date = parseDateOr(params, "date", compliance::Date::today());
    const compliance::TimeOfDay time = parseTimeOrNow(params);
    return toJson(m_monitor.staffingShortfall(period, date, time));
}

std::string WebServer::handleRecord(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const compliance::Date date = parseDateOr(params, "date", compliance::Date::today());
    const compliance::TimeOfDay time = parseTimeOrNow(params);

    std::optional<compliance::PersonId> recordedBy;
    if (hasFormValue(params, "recordedBy")) {
        const long long person = parseInteger(params, "recordedBy");
        if (person <= 0 || person > 4294967295LL) {
            throw compliance::InvalidParameters("recordedBy must be a positive person id");
        }
        recordedBy = static_cast<compliance::PersonId>(person);
    }

    std::string scope = parseFormValue(params, "scope");
    if (scope.empty()) {
        scope = "all";
    }

    if (scope == "single") {
        compliance::RecordRequest request;
        request.period = period;
        request.ageGroup = parseFormValue(params, "ageGroup");
        if (request.ageGroup.empty()) {
            throw compliance::InvalidParameters("ageGroup is required for a single snapshot");
        }
        request.date = date;
        request.time = time;
        request.room = parseOptionalText(params, "room");
        request.recordedBy = recordedBy;
        request.isAutomatic = false;
        request.notes = parseOptionalText(params, "notes");
        const compliance::SnapshotId id = m_store.record(request);
        return R"({"success":true,"snapshotId":)" + std::to_string(id) + "}";
    }
    if (scope == "all") {
        return toJson(m_store.recordAll(period, date, time, recordedBy, false));
    }
    if (scope == "room") {
        return toJson(m_store.recordByRoom(period, date, time, recordedBy, false));
    }
    throw compliance::InvalidParameters("scope must be one of all, room, single");
}

std::string WebServer::handleSnapshotList(const std::string& params) {
    const auto snapshots = m_store.query(parseFilter(params));
    return R"({"count":)" + std::to_string(snapshots.size()) + R"(,"snapshots":)" +
           toJson(snapshots) + "}";
}

std::string WebServer::handleLatestSnapshots(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const compliance::Date date = parseDateOr(params, "date", compliance::Date::today());
    return R"({"date":)" + jsonString(date.toString()) + R"(,"snapshots":)" +
           toJson(m_store.latestPerAgeGroup(period, date)) + "}";
}

std::string WebServer::handleSnapshotExport(const std::string& params,
                                            std::string& contentType,
                                            HeaderList& extraHeaders) {
    const auto snapshots = m_store.query(parseFilter(params));
    contentType = "text/csv; charset=utf-8";
    extraHeaders.emplace_back("Content-Disposition",
                              "attachment; filename=\"ratio-snapshots.csv\"");
    compliance::Logger::instance().log("Exported " + std::to_string(snapshots.size()) +
                                       " ratio snapshots to CSV.");
    return buildCsvExport(snapshots);
}

std::string WebServer::handleRooms(const std::string& params) {
    const auto rooms = m_store.uniqueRooms(requirePeriod(params));
    std::string out = R"({"rooms":[)";
    for (std::size_t i = 0; i < rooms.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += jsonString(rooms[i]);
    }
    out += "]}";
    return out;
}

std::string WebServer::handleAlerts(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const compliance::Date date = parseDateOr(params, "date", compliance::Date::today());
    return R"({"alerts":)" + toJson(m_alerts.snapshotsNeedingAlert(period, date)) + "}";
}

std::string WebServer::handleWarnings(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const compliance::Date date = parseDateOr(params, "date", compliance::Date::today());

    double threshold = m_settings.warningThreshold;
    const std::string raw = parseFormValue(params, "threshold");
    if (!raw.empty()) {
        std::istringstream stream(raw);
        if (!(stream >> threshold) || !stream.eof()) {
            throw compliance::InvalidParameters("threshold must be a number");
        }
    }
    return R"({"threshold":)" + jsonNumber(threshold) + R"(,"warnings":)" +
           toJson(m_alerts.snapshotsAtWarningLevel(period, date, threshold)) + "}";
}

std::string WebServer::handleAcknowledge(const std::string& params, int& statusCode) {
    const long long id = parseInteger(params, "id");
    if (id <= 0) {
        throw compliance::InvalidParameters("id must be a positive snapshot id");
    }
    if (!m_alerts.acknowledge(static_cast<compliance::SnapshotId>(id))) {
        statusCode = 404;
        return R"({"success":false,"error":"Snapshot not found"})";
    }
    return R"({"success":true})";
}

}  // namespace dashboard
