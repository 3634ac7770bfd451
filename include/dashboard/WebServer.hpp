// File: WebServer.hpp
// Description: Declares a lightweight HTTP server exposing live ratios,
//              recorded snapshots, alerts and compliance reports as JSON.

#pragma once

#include "compliance/AlertGate.hpp"
#include "compliance/ComplianceReports.hpp"
#include "compliance/RatioMonitor.hpp"
#include "compliance/SnapshotStore.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dashboard {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct ServerSettings {
    std::optional<compliance::SchoolPeriodId> defaultPeriod;
    double warningThreshold{compliance::AlertGate::kDefaultWarningThreshold};
    int reportWindowDays{30};
};

class WebServer {
public:
    WebServer(compliance::RatioMonitor& monitor,
              compliance::SnapshotStore& store,
              compliance::AlertGate& alerts,
              compliance::ComplianceReports& reports,
              ServerSettings settings,
              int port = 8080);

    void run();

    int port() const noexcept;

    // Routes a single request and maps domain errors to status codes.
    // target may carry a query string. run() calls this for every request.
    std::string handleRequest(const std::string& method,
                              const std::string& target,
                              const std::string& body,
                              std::string& contentType,
                              int& statusCode,
                              HeaderList& extraHeaders);

private:
    compliance::RatioMonitor& m_monitor;
    compliance::SnapshotStore& m_store;
    compliance::AlertGate& m_alerts;
    compliance::ComplianceReports& m_reports;
    ServerSettings m_settings;
    int m_port;

    void handleClient(int clientSocket);
    void sendHttpResponse(int clientSocket,
                          const std::string& statusLine,
                          const std::string& body,
                          const std::string& contentType = "text/plain",
                          const HeaderList& extraHeaders = {});
    void sendBadRequest(int clientSocket, const std::string& message);
    void sendInternalError(int clientSocket, const std::string& message);

    // Ratios and snapshots (WebServerRatios.cpp).
    std::string handleCurrentRatios(const std::string& params);
    std::string handleShortfall(const std::string& params);
    std::string handleRecord(const std::string& params);
    std::string handleSnapshotList(const std::string& params);
    std::string handleLatestSnapshots(const std::string& params);
    std::string handleSnapshotExport(const std::string& params,
                                     std::string& contentType,
                                     HeaderList& extraHeaders);
    std::string handleRooms(const std::string& params);
    std::string handleAlerts(const std::string& params);
    std::string handleWarnings(const std::string& params);
    std::string handleAcknowledge(const std::string& params, int& statusCode);

    // Reports (WebServerReports.cpp).
    std::string handleDailyReport(const std::string& params);
    std::string handleAgeGroupReport(const std::string& params);
    std::string handleTrendReport(const std::string& params);
    std::string handlePeakHoursReport(const std::string& params);
    std::string handleRoomReport(const std::string& params);

    compliance::SchoolPeriodId requirePeriod(const std::string& params) const;
    compliance::Date parseDateOr(const std::string& params,
                                 const std::string& key,
                                 const compliance::Date& fallback) const;
    compliance::TimeOfDay parseTimeOrNow(const std::string& params) const;
    std::pair<compliance::Date, compliance::Date> parseRange(const std::string& params) const;
    compliance::SnapshotFilter parseFilter(const std::string& params) const;
    std::optional<bool> parseOptionalFlag(const std::string& params, const std::string& key) const;
    long long parseInteger(const std::string& params, const std::string& key) const;
    std::optional<std::string> parseOptionalText(const std::string& params,
                                                 const std::string& key) const;
    std::string parseFormValue(const std::string& payload, const std::string& key) const;
    bool hasFormValue(const std::string& payload, const std::string& key) const;
    std::string decodeFormValue(const std::string& value) const;
};

}  // namespace dashboard
