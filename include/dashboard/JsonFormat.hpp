// File: JsonFormat.hpp
// Description: Declares the JSON and CSV renderings of compliance records
//              returned by the dashboard endpoints.

#pragma once

#include "compliance/AlertGate.hpp"
#include "compliance/ComplianceReports.hpp"
#include "compliance/RatioMonitor.hpp"
#include "compliance/SnapshotStore.hpp"

#include <string>
#include <vector>

namespace dashboard {

std::string jsonEscape(const std::string& input);
std::string jsonString(const std::string& value);
std::string jsonNumber(double value);  // two decimal places

std::string toJson(const compliance::RatioEvaluation& evaluation);
std::string toJson(const compliance::RatioSnapshot& snapshot);
std::string toJson(const std::vector<compliance::RatioSnapshot>& snapshots);
std::string toJson(const compliance::RecordOutcome& outcome);
std::string toJson(const compliance::RecordBatch& batch);
std::string toJson(const compliance::StaffingShortfall& shortfall);
std::string toJson(const compliance::ComplianceStats& stats);
std::string toJson(const compliance::DailySummary& summary);
std::string toJson(const compliance::AgeGroupSummary& summary);
std::string toJson(const compliance::TrendPoint& point);
std::string toJson(const compliance::HourlyNonCompliance& bucket);

template <typename T>
std::string toJsonArray(const std::vector<T>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += toJson(items[i]);
    }
    out += "]";
    return out;
}

// Header row plus one line per snapshot; UTF-8 BOM for spreadsheet apps.
std::string buildCsvExport(const std::vector<compliance::RatioSnapshot>& snapshots);

}  // namespace dashboard
