// File: WebServer.cpp
// Description: Implements a minimal HTTP server: socket loop, request
//              parsing, routing and the mapping of compliance errors to
//              HTTP status codes.

#include "dashboard/WebServer.hpp"

#include "compliance/Config.hpp"
#include "compliance/Errors.hpp"
#include "compliance/Logger.hpp"
#include "dashboard/JsonFormat.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace dashboard {

namespace {
constexpr std::size_t kReadBufferSize = 4096;
constexpr std::size_t kMaxHeaderBytes = 65536;

std::string reasonPhrase(int statusCode) {
    switch (statusCode) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 409:
            return "Conflict";
        case 503:
            return "Service Unavailable";
        default:
            return statusCode >= 500 ? "Internal Server Error" : "Error";
    }
}

std::string errorBody(const std::string& message, const std::string& kind) {
    return R"({"success":false,"error":)" + jsonString(message) + R"(,"kind":)" +
           jsonString(kind) + "}";
}

int statusFor(compliance::ErrorKind kind) {
    switch (kind) {
        case compliance::ErrorKind::InvalidParameters:
        case compliance::ErrorKind::UnknownAgeGroup:
            return 400;
        case compliance::ErrorKind::DuplicateSnapshot:
            return 409;
        case compliance::ErrorKind::DataUnavailable:
            return 503;
        case compliance::ErrorKind::StorageFailure:
            return 500;
    }
    return 500;
}

}  // namespace

WebServer::WebServer(compliance::RatioMonitor& monitor,
                     compliance::SnapshotStore& store,
                     compliance::AlertGate& alerts,
                     compliance::ComplianceReports& reports,
                     ServerSettings settings,
                     int port)
    : m_monitor(monitor),
      m_store(store),
      m_alerts(alerts),
      m_reports(reports),
      m_settings(std::move(settings)),
      m_port(port) {}

int WebServer::port() const noexcept {
    return m_port;
}

void WebServer::run() {
    int serverSocket = -1;
    int attempt = 0;
    int currentPort = m_port;
    constexpr int kMaxAttempts = 10;

    while (attempt < kMaxAttempts) {
        serverSocket = ::socket(AF_INET, SOCK_STREAM, 0);
        if (serverSocket < 0) {
            throw std::runtime_error("Failed to create server socket.");
        }

        int opt = 1;
        if (setsockopt(serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            ::close(serverSocket);
            throw std::runtime_error("Failed to set socket options.");
        }

        sockaddr_in address {};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = INADDR_ANY;
        address.sin_port = htons(static_cast<uint16_t>(currentPort));

        if (bind(serverSocket, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0) {
            if (listen(serverSocket, 16) < 0) {
                ::close(serverSocket);
                throw std::runtime_error("Failed to listen on server socket.");
            }
            if (currentPort != m_port) {
                compliance::Logger::instance().warn("Requested port " + std::to_string(m_port) +
                                                    " unavailable; using fallback port " +
                                                    std::to_string(currentPort) + ".");
            }
            m_port = currentPort;
            break;
        }

        ::close(serverSocket);
        serverSocket = -1;
        ++attempt;
        ++currentPort;
    }

    if (serverSocket < 0) {
        throw std::runtime_error("Failed to bind server socket after multiple attempts.");
    }

    compliance::Logger::instance().log("Dashboard listening on port " + std::to_string(m_port) + ".");

    while (true) {
        sockaddr_in clientAddress {};
        socklen_t clientLen = sizeof(clientAddress);
        int clientSocket = accept(serverSocket, reinterpret_cast<sockaddr*>(&clientAddress), &clientLen);
        if (clientSocket < 0) {
            compliance::Logger::instance().warn("Failed to accept client connection.");
            continue;
        }

        std::thread(&WebServer::handleClient, this, clientSocket).detach();
    }
}

void WebServer::handleClient(int clientSocket) {
    std::string request;
    request.reserve(1024);

    char buffer[kReadBufferSize];
    ssize_t bytesRead = 0;

    while (request.find("\r\n\r\n") == std::string::npos) {
        bytesRead = recv(clientSocket, buffer, sizeof(buffer), 0);
        if (bytesRead <= 0) {
            ::close(clientSocket);
            return;
        }
        request.append(buffer, static_cast<std::size_t>(bytesRead));
        if (request.size() > kMaxHeaderBytes) {
            sendBadRequest(clientSocket, "Request header too large.");
            return;
        }
    }

    const std::size_t headerEnd = request.find("\r\n\r\n");
    std::string headerPart = request.substr(0, headerEnd + 4);
    std::string body = request.substr(headerEnd + 4);

    std::istringstream headerStream(headerPart);
    std::string requestLine;
    if (!std::getline(headerStream, requestLine)) {
        sendBadRequest(clientSocket, "Malformed request line.");
        return;
    }
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    std::istringstream requestLineStream(requestLine);
    std::string method;
    std::string target;
    std::string version;
    requestLineStream >> method >> target >> version;
    if (method.empty() || target.empty()) {
        sendBadRequest(clientSocket, "Missing method or path.");
        return;
    }

    std::string line;
    std::size_t contentLength = 0;
    while (std::getline(headerStream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        const std::size_t colonPos = line.find(':');
        if (colonPos == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, colonPos);
        for (char& ch : key) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (key == "content-length") {
            const std::string value = line.substr(colonPos + 1);
            char* endPtr = nullptr;
            errno = 0;
            const unsigned long parsed = std::strtoul(value.c_str(), &endPtr, 10);
            if (errno != 0 || endPtr == value.c_str()) {
                sendBadRequest(clientSocket, "Invalid Content-Length header.");
                return;
            }
            contentLength = static_cast<std::size_t>(parsed);
        }
    }

    while (body.size() < contentLength) {
        bytesRead = recv(clientSocket, buffer, sizeof(buffer), 0);
        if (bytesRead <= 0) {
            ::close(clientSocket);
            return;
        }
        body.append(buffer, static_cast<std::size_t>(bytesRead));
    }

    std::string contentType = "application/json";
    int statusCode = 200;
    HeaderList extraHeaders;
    std::string responseBody;

    compliance::Logger::instance().log("Request: " + method + " " + target);

    try {
        responseBody = handleRequest(method, target, body, contentType, statusCode, extraHeaders);
    } catch (const std::exception& ex) {
        compliance::Logger::instance().error(std::string("Internal error while handling request: ") +
                                             ex.what());
        sendInternalError(clientSocket, ex.what());
        return;
    }

    std::ostringstream statusLine;
    statusLine << "HTTP/1.1 " << statusCode << " " << reasonPhrase(statusCode);
    sendHttpResponse(clientSocket, statusLine.str(), responseBody, contentType, extraHeaders);
}

std::string WebServer::handleRequest(const std::string& method,
                                     const std::string& target,
                                     const std::string& body,
                                     std::string& contentType,
                                     int& statusCode,
                                     HeaderList& extraHeaders) {
    contentType = "application/json";
    statusCode = 200;

    const std::size_t queryPos = target.find('?');
    const std::string path = target.substr(0, queryPos);
    std::string params = queryPos == std::string::npos ? std::string() : target.substr(queryPos + 1);
    if (method == "POST" && !body.empty()) {
        params += params.empty() ? body : "&" + body;
    }

    try {
        if (method == "GET") {
            if (path == "/api/ratios/current") {
                return handleCurrentRatios(params);
            }
            if (path == "/api/ratios/shortfall") {
                return handleShortfall(params);
            }
            if (path == "/api/snapshots") {
                return handleSnapshotList(params);
            }
            if (path == "/api/snapshots/latest") {
                return handleLatestSnapshots(params);
            }
            if (path == "/api/snapshots/export") {
                return handleSnapshotExport(params, contentType, extraHeaders);
            }
            if (path == "/api/rooms") {
                return handleRooms(params);
            }
            if (path == "/api/alerts") {
                return handleAlerts(params);
            }
            if (path == "/api/alerts/warning") {
                return handleWarnings(params);
            }
            if (path == "/api/reports/daily") {
                return handleDailyReport(params);
            }
            if (path == "/api/reports/age-groups") {
                return handleAgeGroupReport(params);
            }
            if (path == "/api/reports/trend") {
                return handleTrendReport(params);
            }
            if (path == "/api/reports/peak-hours") {
                return handlePeakHoursReport(params);
            }
            if (path == "/api/reports/room") {
                return handleRoomReport(params);
            }
        } else if (method == "POST") {
            if (path == "/api/snapshots/record") {
                return handleRecord(params);
            }
            if (path == "/api/alerts/ack") {
                return handleAcknowledge(params, statusCode);
            }
        }
    } catch (const compliance::ComplianceError& ex) {
        statusCode = statusFor(ex.kind());
        contentType = "application/json";
        extraHeaders.clear();
        compliance::Logger::instance().warn("Responded " + std::to_string(statusCode) + " for " +
                                            method + " " + path + ": " + ex.what());
        return errorBody(ex.what(), compliance::toString(ex.kind()));
    }

    statusCode = 404;
    compliance::Logger::instance().log("Responded 404 for " + method + " " + path + ".");
    return R"({"success":false,"error":"Not Found"})";
}

void WebServer::sendHttpResponse(int clientSocket,
                                 const std::string& statusLine,
                                 const std::string& body,
                                 const std::string& contentType,
                                 const HeaderList& extraHeaders) {
    std::ostringstream response;
    response << statusLine << "\r\n";
    response << "Content-Type: " << contentType << "\r\n";
    response << "Content-Length: " << body.size() << "\r\n";
    for (const auto& header : extraHeaders) {
        response << header.first << ": " << header.second << "\r\n";
    }
    response << "Connection: close\r\n\r\n";
    response << body;

    const std::string responseStr = response.str();
    std::size_t sent = 0;
    while (sent < responseStr.size()) {
        const ssize_t written =
            send(clientSocket, responseStr.data() + sent, responseStr.size() - sent, MSG_NOSIGNAL);
        if (written <= 0) {
            compliance::Logger::instance().warn("Client disconnected before response completed.");
            break;
        }
        sent += static_cast<std::size_t>(written);
    }
    ::close(clientSocket);
}

void WebServer::sendBadRequest(int clientSocket, const std::string& message) {
    sendHttpResponse(clientSocket, "HTTP/1.1 400 Bad Request",
                     errorBody(message, compliance::toString(compliance::ErrorKind::InvalidParameters)),
                     "application/json");
}

void WebServer::sendInternalError(int clientSocket, const std::string& message) {
    sendHttpResponse(clientSocket, "HTTP/1.1 500 Internal Server Error",
                     R"({"success":false,"error":)" + jsonString(message) + "}",
                     "application/json");
}

compliance::SchoolPeriodId WebServer::requirePeriod(const std::string& params) const {
    if (hasFormValue(params, "period")) {
        const long long value = parseInteger(params, "period");
        if (value <= 0 || value > compliance::kMaxSchoolPeriodId) {
            throw compliance::InvalidParameters("period must be a positive school period id");
        }
        return static_cast<compliance::SchoolPeriodId>(value);
    }
    if (m_settings.defaultPeriod) {
        return *m_settings.defaultPeriod;
    }
    throw compliance::InvalidParameters("period is required");
}

compliance::Date WebServer::parseDateOr(const std::string& params,
                                        const std::string& key,
                                        const compliance::Date& fallback) const {
    const std::string raw = parseFormValue(params, key);
    if (raw.empty()) {
        return fallback;
    }
    return compliance::Date::parse(raw);
}

compliance::TimeOfDay WebServer::parseTimeOrNow(const std::string& params) const {
    const std::string raw = parseFormValue(params, "time");
    if (raw.empty()) {
        return compliance::TimeOfDay::now();
    }
    return compliance::TimeOfDay::parse(raw);
}

std::pair<compliance::Date, compliance::Date> WebServer::parseRange(const std::string& params) const {
    const compliance::Date to = parseDateOr(params, "to", compliance::Date::today());
    const compliance::Date from = parseDateOr(params, "from", to.addDays(-m_settings.reportWindowDays));
    return {from, to};
}

compliance::SnapshotFilter WebServer::parseFilter(const std::string& params) const {
    compliance::SnapshotFilter filter;
    filter.period = requirePeriod(params);
    if (hasFormValue(params, "date")) {
        filter.date = compliance::Date::parse(parseFormValue(params, "date"));
    }
    if (hasFormValue(params, "from")) {
        filter.dateFrom = compliance::Date::parse(parseFormValue(params, "from"));
    }
    if (hasFormValue(params, "to")) {
        filter.dateTo = compliance::Date::parse(parseFormValue(params, "to"));
    }
    filter.ageGroup = parseOptionalText(params, "ageGroup");
    filter.room = parseOptionalText(params, "room");
    filter.isCompliant = parseOptionalFlag(params, "compliant");
    filter.alertSent = parseOptionalFlag(params, "alertSent");
    filter.isAutomatic = parseOptionalFlag(params, "automatic");
    return filter;
}

std::optional<bool> WebServer::parseOptionalFlag(const std::string& params,
                                                 const std::string& key) const {
    if (!hasFormValue(params, key)) {
        return std::nullopt;
    }
    std::string lowerValue;
    for (char ch : parseFormValue(params, key)) {
        lowerValue.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lowerValue == "1" || lowerValue == "true" || lowerValue == "yes" || lowerValue == "y") {
        return true;
    }
    if (lowerValue == "0" || lowerValue == "false" || lowerValue == "no" || lowerValue == "n") {
        return false;
    }
    throw compliance::InvalidParameters(key + " must be a boolean flag");
}

long long WebServer::parseInteger(const std::string& params, const std::string& key) const {
    const std::string raw = parseFormValue(params, key);
    if (raw.empty()) {
        throw compliance::InvalidParameters(key + " is required");
    }
    char* endPtr = nullptr;
    errno = 0;
    const long long value = std::strtoll(raw.c_str(), &endPtr, 10);
    if (errno != 0 || endPtr == raw.c_str() || *endPtr != '\0') {
        throw compliance::InvalidParameters(key + " must be an integer");
    }
    return value;
}

std::optional<std::string> WebServer::parseOptionalText(const std::string& params,
                                                        const std::string& key) const {
    std::string value = parseFormValue(params, key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool WebServer::hasFormValue(const std::string& payload, const std::string& key) const {
    return !parseFormValue(payload, key).empty();
}

std::string WebServer::parseFormValue(const std::string& payload,
                                      const std::string& key) const {
    if (key.empty()) {
        return {};
    }
    const std::string needle = key + "=";
    std::size_t start = 0;
    while (start <= payload.size()) {
        const std::size_t endPos = payload.find('&', start);
        const std::string pair =
            payload.substr(start, endPos == std::string::npos ? std::string::npos : endPos - start);
        if (pair.compare(0, needle.size(), needle) == 0) {
            return decodeFormValue(pair.substr(needle.size()));
        }
        if (endPos == std::string::npos) {
            break;
        }
        start = endPos + 1;
    }
    return {};
}

std::string WebServer::decodeFormValue(const std::string& value) const {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            const std::string hex = value.substr(i + 1, 2);
            char* endPtr = nullptr;
            const long numeric = std::strtol(hex.c_str(), &endPtr, 16);
            if (endPtr != nullptr && *endPtr == '\0') {
                decoded.push_back(static_cast<char>(numeric));
                i += 2;
                continue;
            }
        } else if (value[i] == '+') {
            decoded.push_back(' ');
            continue;
        }
        decoded.push_back(value[i]);
    }
    return decoded;
}

}  // namespace dashboard
