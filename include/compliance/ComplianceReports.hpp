// File: ComplianceReports.hpp
// Description: Declares read-only roll-ups of ratio snapshots for the
//              compliance and trend dashboards.

#pragma once

#include "compliance/SnapshotStore.hpp"

#include <optional>
#include <string>
#include <vector>

namespace compliance {

struct ComplianceStats {
    std::size_t totalSnapshots{0};
    std::size_t compliantSnapshots{0};
    std::size_t nonCompliantSnapshots{0};
    std::size_t alertsSent{0};
    double minCompliancePercent{0.0};
    double avgCompliancePercent{0.0};
    double maxCompliancePercent{0.0};
    double avgStaffCount{0.0};
    double avgChildCount{0.0};
    // compliant / total * 100; 100 for an empty set.
    double complianceRate{100.0};
};

struct DailySummary {
    Date date;
    ComplianceStats stats;
    std::optional<TimeOfDay> firstSnapshot;
    std::optional<TimeOfDay> lastSnapshot;
};

struct AgeGroupSummary {
    std::string ageGroup;
    int requiredRatio{0};
    ComplianceStats stats;
};

struct TrendPoint {
    Date date;
    std::size_t totalSnapshots{0};
    std::size_t compliantSnapshots{0};
    double complianceRate{100.0};
    double avgCompliancePercent{0.0};
    long long totalStaff{0};
    long long totalChildren{0};
};

struct HourlyNonCompliance {
    int hour{0};
    std::size_t totalSnapshots{0};
    std::size_t nonCompliantCount{0};
    double nonComplianceRate{0.0};
};

ComplianceStats summarize(const std::vector<RatioSnapshot>& snapshots);

class ComplianceReports {
public:
    explicit ComplianceReports(SnapshotStore& store);

    DailySummary dailySummary(SchoolPeriodId period, const Date& date);

    // Grouped by (age group, stored required ratio), ordered by age group.
    std::vector<AgeGroupSummary> summaryByAgeGroup(SchoolPeriodId period,
                                                   const Date& from,
                                                   const Date& to);

    // One point per date that has snapshots, ascending.
    std::vector<TrendPoint> complianceTrend(SchoolPeriodId period, const Date& from, const Date& to);

    // Hours of day ranked by non-compliance rate (desc), then hour (asc).
    std::vector<HourlyNonCompliance> peakNonComplianceHours(SchoolPeriodId period,
                                                            const Date& from,
                                                            const Date& to);

    // All snapshots for one room in the range, newest first.
    std::vector<RatioSnapshot> roomHistory(SchoolPeriodId period,
                                           const std::string& room,
                                           const Date& from,
                                           const Date& to);

private:
    SnapshotStore& m_store;
};

}  // namespace compliance
