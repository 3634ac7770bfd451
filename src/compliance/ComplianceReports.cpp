// File: ComplianceReports.cpp
// Description: Implements the snapshot roll-ups behind the compliance
//              dashboards.

#include "compliance/ComplianceReports.hpp"

#include "compliance/Errors.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace compliance {

namespace {

double rate(std::size_t part, std::size_t total) {
    return roundToCents(static_cast<double>(part) / static_cast<double>(total) * 100.0);
}

void requireOrderedRange(const Date& from, const Date& to) {
    if (to < from) {
        throw InvalidParameters("Date range ends before it starts: " + from.toString() + " to " +
                                to.toString() + ".");
    }
}

}  // namespace

ComplianceStats summarize(const std::vector<RatioSnapshot>& snapshots) {
    ComplianceStats stats;
    if (snapshots.empty()) {
        return stats;
    }

    double percentSum = 0.0;
    double staffSum = 0.0;
    double childSum = 0.0;
    stats.minCompliancePercent = snapshots.front().compliancePercent;
    stats.maxCompliancePercent = snapshots.front().compliancePercent;
    for (const auto& snapshot : snapshots) {
        ++stats.totalSnapshots;
        if (snapshot.isCompliant) {
            ++stats.compliantSnapshots;
        } else {
            ++stats.nonCompliantSnapshots;
        }
        if (snapshot.alertSent) {
            ++stats.alertsSent;
        }
        stats.minCompliancePercent = std::min(stats.minCompliancePercent, snapshot.compliancePercent);
        stats.maxCompliancePercent = std::max(stats.maxCompliancePercent, snapshot.compliancePercent);
        percentSum += snapshot.compliancePercent;
        staffSum += snapshot.staffCount;
        childSum += snapshot.childCount;
    }

    const double total = static_cast<double>(stats.totalSnapshots);
    stats.avgCompliancePercent = roundToCents(percentSum / total);
    stats.avgStaffCount = roundToCents(staffSum / total);
    stats.avgChildCount = roundToCents(childSum / total);
    stats.complianceRate = rate(stats.compliantSnapshots, stats.totalSnapshots);
    return stats;
}

ComplianceReports::ComplianceReports(SnapshotStore& store) : m_store(store) {}

DailySummary ComplianceReports::dailySummary(SchoolPeriodId period, const Date& date) {
    const std::vector<RatioSnapshot> snapshots = m_store.byDate(period, date);

    DailySummary summary;
    summary.date = date;
    summary.stats = summarize(snapshots);
    for (const auto& snapshot : snapshots) {
        if (!summary.firstSnapshot || snapshot.snapshotTime < *summary.firstSnapshot) {
            summary.firstSnapshot = snapshot.snapshotTime;
        }
        if (!summary.lastSnapshot || snapshot.snapshotTime > *summary.lastSnapshot) {
            summary.lastSnapshot = snapshot.snapshotTime;
        }
    }
    return summary;
}

std::vector<AgeGroupSummary> ComplianceReports::summaryByAgeGroup(SchoolPeriodId period,
                                                                  const Date& from,
                                                                  const Date& to) {
    requireOrderedRange(from, to);
    std::map<std::pair<std::string, int>, std::vector<RatioSnapshot>> groups;
    for (auto& snapshot : m_store.byDateRange(period, from, to)) {
        groups[{snapshot.ageGroup, snapshot.requiredRatio}].push_back(std::move(snapshot));
    }

    std::vector<AgeGroupSummary> result;
    result.reserve(groups.size());
    for (const auto& [key, members] : groups) {
        result.push_back(AgeGroupSummary{key.first, key.second, summarize(members)});
    }
    return result;
}

std::vector<TrendPoint> ComplianceReports::complianceTrend(SchoolPeriodId period,
                                                           const Date& from,
                                                           const Date& to) {
    requireOrderedRange(from, to);
    std::map<long long, std::vector<RatioSnapshot>> days;
    for (auto& snapshot : m_store.byDateRange(period, from, to)) {
        days[snapshot.snapshotDate.toDays()].push_back(std::move(snapshot));
    }

    std::vector<TrendPoint> trend;
    trend.reserve(days.size());
    for (const auto& [dayNumber, members] : days) {
        const ComplianceStats stats = summarize(members);
        TrendPoint point;
        point.date = Date::fromDays(dayNumber);
        point.totalSnapshots = stats.totalSnapshots;
        point.compliantSnapshots = stats.compliantSnapshots;
        point.complianceRate = stats.complianceRate;
        point.avgCompliancePercent = stats.avgCompliancePercent;
        for (const auto& snapshot : members) {
            point.totalStaff += snapshot.staffCount;
            point.totalChildren += snapshot.childCount;
        }
        trend.push_back(point);
    }
    return trend;
}

std::vector<HourlyNonCompliance> ComplianceReports::peakNonComplianceHours(SchoolPeriodId period,
                                                                           const Date& from,
                                                                           const Date& to) {
    requireOrderedRange(from, to);
    std::map<int, HourlyNonCompliance> hours;
    for (const auto& snapshot : m_store.byDateRange(period, from, to)) {
        HourlyNonCompliance& bucket = hours[snapshot.snapshotTime.hour];
        bucket.hour = snapshot.snapshotTime.hour;
        ++bucket.totalSnapshots;
        if (!snapshot.isCompliant) {
            ++bucket.nonCompliantCount;
        }
    }

    std::vector<HourlyNonCompliance> ranked;
    ranked.reserve(hours.size());
    for (auto& entry : hours) {
        entry.second.nonComplianceRate =
            rate(entry.second.nonCompliantCount, entry.second.totalSnapshots);
        ranked.push_back(entry.second);
    }
    std::sort(ranked.begin(), ranked.end(),
              [](const HourlyNonCompliance& a, const HourlyNonCompliance& b) {
                  if (a.nonComplianceRate != b.nonComplianceRate) {
                      return a.nonComplianceRate > b.nonComplianceRate;
                  }
                  return a.hour < b.hour;
              });
    return ranked;
}

std::vector<RatioSnapshot> ComplianceReports::roomHistory(SchoolPeriodId period,
                                                          const std::string& room,
                                                          const Date& from,
                                                          const Date& to) {
    requireOrderedRange(from, to);
    if (room.empty()) {
        throw InvalidParameters("Room name must not be empty.");
    }
    SnapshotFilter filter;
    filter.period = period;
    filter.room = room;
    filter.dateFrom = from;
    filter.dateTo = to;
    return m_store.query(filter);
}

}  // namespace compliance
