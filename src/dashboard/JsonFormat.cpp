// File: JsonFormat.cpp
// Description: Implements JSON and CSV rendering for the dashboard API.

#include "dashboard/JsonFormat.hpp"

#include "compliance/Errors.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace dashboard {

namespace {

std::string jsonOptional(const std::optional<std::string>& value) {
    return value ? jsonString(*value) : std::string("null");
}

std::string jsonBool(bool value) {
    return value ? "true" : "false";
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted += "\"";
    return quoted;
}

void appendRatio(std::ostringstream& oss, const compliance::ActualRatio& ratio) {
    oss << R"("actualRatio":)" << (ratio.isUnbounded() ? "null" : jsonNumber(ratio.value())) << ","
        << R"("ratioUnbounded":)" << jsonBool(ratio.isUnbounded());
}

}  // namespace

std::string jsonEscape(const std::string& input) {
    std::string output;
    output.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '\\':
                output += "\\\\";
                break;
            case '"':
                output += "\\\"";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u"
                        << std::hex << std::uppercase << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(ch));
                    output += oss.str();
                } else {
                    output += ch;
                }
                break;
        }
    }
    return output;
}

std::string jsonString(const std::string& value) {
    return "\"" + jsonEscape(value) + "\"";
}

std::string jsonNumber(double value) {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return std::string(buffer);
}

std::string toJson(const compliance::RatioEvaluation& evaluation) {
    std::ostringstream oss;
    oss << R"({"ageGroup":)" << jsonString(evaluation.ageGroup) << ","
        << R"("room":)" << jsonOptional(evaluation.room) << ","
        << R"("staffCount":)" << evaluation.staffCount << ","
        << R"("childCount":)" << evaluation.childCount << ","
        << R"("requiredRatio":)" << evaluation.requiredRatio << ",";
    appendRatio(oss, evaluation.actualRatio);
    oss << R"(,"isCompliant":)" << jsonBool(evaluation.isCompliant) << ","
        << R"("compliancePercent":)" << jsonNumber(evaluation.compliancePercent) << ","
        << R"("staffNeeded":)" << evaluation.staffNeeded << ","
        << R"("additionalCapacity":)" << evaluation.additionalCapacity << ","
        << R"("calculatedAt":)" << jsonString(evaluation.calculatedAt) << "}";
    return oss.str();
}

std::string toJson(const compliance::RatioSnapshot& snapshot) {
    std::ostringstream oss;
    oss << R"({"id":)" << snapshot.id << ","
        << R"("period":)" << snapshot.period << ","
        << R"("date":)" << jsonString(snapshot.snapshotDate.toString()) << ","
        << R"("time":)" << jsonString(snapshot.snapshotTime.toString()) << ","
        << R"("ageGroup":)" << jsonString(snapshot.ageGroup) << ","
        << R"("room":)" << jsonOptional(snapshot.room) << ","
        << R"("staffCount":)" << snapshot.staffCount << ","
        << R"("childCount":)" << snapshot.childCount << ","
        << R"("requiredRatio":)" << snapshot.requiredRatio << ",";
    appendRatio(oss, snapshot.actualRatio);
    oss << R"(,"isCompliant":)" << jsonBool(snapshot.isCompliant) << ","
        << R"("compliancePercent":)" << jsonNumber(snapshot.compliancePercent) << ","
        << R"("alertSent":)" << jsonBool(snapshot.alertSent) << ","
        << R"("alertSentTime":)" << jsonOptional(snapshot.alertSentTime) << ","
        << R"("notes":)" << jsonOptional(snapshot.notes) << ","
        << R"("isAutomatic":)" << jsonBool(snapshot.isAutomatic) << ","
        << R"("recordedBy":)"
        << (snapshot.recordedBy ? std::to_string(*snapshot.recordedBy) : std::string("null"))
        << "}";
    return oss.str();
}

std::string toJson(const std::vector<compliance::RatioSnapshot>& snapshots) {
    return toJsonArray(snapshots);
}

std::string toJson(const compliance::RecordOutcome& outcome) {
    std::ostringstream oss;
    oss << R"({"ageGroup":)" << jsonString(outcome.ageGroup) << ","
        << R"("room":)" << jsonOptional(outcome.room) << ","
        << R"("recorded":)" << jsonBool(outcome.recorded()) << ","
        << R"("snapshotId":)"
        << (outcome.snapshotId ? std::to_string(*outcome.snapshotId) : std::string("null")) << ","
        << R"("error":)"
        << (outcome.error ? jsonString(compliance::toString(*outcome.error)) : std::string("null"))
        << "," << R"("message":)" << jsonString(outcome.message) << "}";
    return oss.str();
}

std::string toJson(const compliance::RecordBatch& batch) {
    std::ostringstream oss;
    oss << R"({"recorded":)" << batch.recordedCount() << ","
        << R"("failed":)" << batch.failedCount() << ","
        << R"("results":)" << toJsonArray(batch.outcomes) << "}";
    return oss.str();
}

std::string toJson(const compliance::StaffingShortfall& shortfall) {
    std::ostringstream oss;
    oss << R"({"totalStaffNeeded":)" << shortfall.totalStaffNeeded << ","
        << R"("overallCompliant":)" << jsonBool(shortfall.overallCompliant) << ","
        << R"("calculatedAt":)" << jsonString(shortfall.calculatedAt) << ","
        << R"("details":)" << toJsonArray(shortfall.details) << "}";
    return oss.str();
}

std::string toJson(const compliance::ComplianceStats& stats) {
    std::ostringstream oss;
    oss << R"({"totalSnapshots":)" << stats.totalSnapshots << ","
        << R"("compliantSnapshots":)" << stats.compliantSnapshots << ","
        << R"("nonCompliantSnapshots":)" << stats.nonCompliantSnapshots << ","
        << R"("alertsSent":)" << stats.alertsSent << ","
        << R"("minCompliancePercent":)" << jsonNumber(stats.minCompliancePercent) << ","
        << R"("avgCompliancePercent":)" << jsonNumber(stats.avgCompliancePercent) << ","
        << R"("maxCompliancePercent":)" << jsonNumber(stats.maxCompliancePercent) << ","
        << R"("avgStaffCount":)" << jsonNumber(stats.avgStaffCount) << ","
        << R"("avgChildCount":)" << jsonNumber(stats.avgChildCount) << ","
        << R"("complianceRate":)" << jsonNumber(stats.complianceRate) << "}";
    return oss.str();
}

std::string toJson(const compliance::DailySummary& summary) {
    std::ostringstream oss;
    oss << R"({"date":)" << jsonString(summary.date.toString()) << ","
        << R"("firstSnapshot":)"
        << (summary.firstSnapshot ? jsonString(summary.firstSnapshot->toString()) : "null") << ","
        << R"("lastSnapshot":)"
        << (summary.lastSnapshot ? jsonString(summary.lastSnapshot->toString()) : "null") << ","
        << R"("stats":)" << toJson(summary.stats) << "}";
    return oss.str();
}

std::string toJson(const compliance::AgeGroupSummary& summary) {
    std::ostringstream oss;
    oss << R"({"ageGroup":)" << jsonString(summary.ageGroup) << ","
        << R"("requiredRatio":)" << summary.requiredRatio << ","
        << R"("stats":)" << toJson(summary.stats) << "}";
    return oss.str();
}

std::string toJson(const compliance::TrendPoint& point) {
    std::ostringstream oss;
    oss << R"({"date":)" << jsonString(point.date.toString()) << ","
        << R"("totalSnapshots":)" << point.totalSnapshots << ","
        << R"("compliantSnapshots":)" << point.compliantSnapshots << ","
        << R"("complianceRate":)" << jsonNumber(point.complianceRate) << ","
        << R"("avgCompliancePercent":)" << jsonNumber(point.avgCompliancePercent) << ","
        << R"("totalStaff":)" << point.totalStaff << ","
        << R"("totalChildren":)" << point.totalChildren << "}";
    return oss.str();
}

std::string toJson(const compliance::HourlyNonCompliance& bucket) {
    std::ostringstream oss;
    oss << R"({"hour":)" << bucket.hour << ","
        << R"("totalSnapshots":)" << bucket.totalSnapshots << ","
        << R"("nonCompliantCount":)" << bucket.nonCompliantCount << ","
        << R"("nonComplianceRate":)" << jsonNumber(bucket.nonComplianceRate) << "}";
    return oss.str();
}

std::string buildCsvExport(const std::vector<compliance::RatioSnapshot>& snapshots) {
    std::ostringstream oss;
    oss << "\xEF\xBB\xBF";
    oss << "Date,Time,Age Group,Room,Staff Count,Child Count,Required Ratio,Actual Ratio,"
           "Capacity %,Compliant,Alert Sent,Notes\n";
    for (const auto& snapshot : snapshots) {
        oss << snapshot.snapshotDate.toString() << ","
            << snapshot.snapshotTime.toString() << ","
            << csvField(snapshot.ageGroup) << ","
            << csvField(snapshot.room.value_or("")) << ","
            << snapshot.staffCount << ","
            << snapshot.childCount << ","
            << snapshot.requiredRatio << ","
            << snapshot.actualRatio.toString() << ","
            << jsonNumber(snapshot.compliancePercent) << ","
            << (snapshot.isCompliant ? "Yes" : "No") << ","
            << (snapshot.alertSent ? "Yes" : "No") << ","
            << csvField(snapshot.notes.value_or("")) << "\n";
    }
    return oss.str();
}

}  // namespace dashboard
