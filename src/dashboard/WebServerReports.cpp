// File: WebServerReports.cpp
// Description: Compliance report endpoints.

#include "dashboard/WebServer.hpp"

#include "compliance/Errors.hpp"
#include "dashboard/JsonFormat.hpp"

namespace dashboard {

namespace {

std::string rangeJson(const std::pair<compliance::Date, compliance::Date>& range) {
    return R"("from":)" + jsonString(range.first.toString()) + R"(,"to":)" +
           jsonString(range.second.toString());
}

}  // namespace

std::string WebServer::handleDailyReport(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const compliance::Date date = parseDateOr(params, "date", compliance::Date::today());
    return toJson(m_reports.dailySummary(period, date));
}

std::string WebServer::handleAgeGroupReport(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const auto range = parseRange(params);
    return "{" + rangeJson(range) + R"(,"ageGroups":)" +
           toJsonArray(m_reports.summaryByAgeGroup(period, range.first, range.second)) + "}";
}

std::string WebServer::handleTrendReport(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const auto range = parseRange(params);
    return "{" + rangeJson(range) + R"(,"trend":)" +
           toJsonArray(m_reports.complianceTrend(period, range.first, range.second)) + "}";
}

std::string WebServer::handlePeakHoursReport(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const auto range = parseRange(params);
    return "{" + rangeJson(range) + R"(,"hours":)" +
           toJsonArray(m_reports.peakNonComplianceHours(period, range.first, range.second)) + "}";
}

std::string WebServer::handleRoomReport(const std::string& params) {
    const compliance::SchoolPeriodId period = requirePeriod(params);
    const std::string room = parseFormValue(params, "room");
    if (room.empty()) {
        throw compliance::InvalidParameters("room is required");
    }
    const auto range = parseRange(params);
    const auto history = m_reports.roomHistory(period, room, range.first, range.second);
    return "{" + rangeJson(range) + R"(,"room":)" + jsonString(room) + R"(,"stats":)" +
           toJson(compliance::summarize(history)) + R"(,"snapshots":)" + toJson(history) + "}";
}

}  // namespace dashboard
