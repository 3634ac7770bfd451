// File: SnapshotStore.cpp
// Description: Implements snapshot recording, per-entry batch recording and
//              the read-side snapshot queries.

#include "compliance/SnapshotStore.hpp"

#include "compliance/Config.hpp"
#include "compliance/Logger.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace compliance {

std::size_t RecordBatch::recordedCount() const {
    return static_cast<std::size_t>(std::count_if(
        outcomes.begin(), outcomes.end(), [](const RecordOutcome& o) { return o.recorded(); }));
}

std::size_t RecordBatch::failedCount() const {
    return outcomes.size() - recordedCount();
}

std::size_t RecordBatch::hardFailureCount() const {
    return static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(), [](const RecordOutcome& o) {
            return o.error && *o.error != ErrorKind::DuplicateSnapshot;
        }));
}

SnapshotStore::SnapshotStore(SnapshotRepository& repository, RatioMonitor& monitor, Clock clock)
    : m_repository(repository), m_monitor(monitor), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return currentTimestamp(); };
    }
}

SnapshotId SnapshotStore::record(const RecordRequest& request) {
    const RatioEvaluation evaluation = m_monitor.currentRatio(
        request.period, request.ageGroup, request.date, request.time, request.room);

    RatioSnapshot snapshot;
    snapshot.period = request.period;
    snapshot.snapshotDate = request.date;
    snapshot.snapshotTime = request.time;
    snapshot.ageGroup = evaluation.ageGroup;
    snapshot.room = request.room;
    snapshot.staffCount = evaluation.staffCount;
    snapshot.childCount = evaluation.childCount;
    snapshot.requiredRatio = evaluation.requiredRatio;
    snapshot.actualRatio = evaluation.actualRatio;
    snapshot.isCompliant = evaluation.isCompliant;
    snapshot.compliancePercent = evaluation.compliancePercent;
    snapshot.notes = request.notes;
    snapshot.isAutomatic = request.isAutomatic;
    snapshot.recordedBy = request.recordedBy;

    // Uniqueness is enforced by the repository's insert, not by a lookup here.
    const SnapshotId id = m_repository.insert(snapshot);
    Logger::instance().log("Recorded ratio snapshot #" + std::to_string(id) + " for " +
                           describeKey(snapshot) + ": " + std::to_string(snapshot.childCount) +
                           " children / " + std::to_string(snapshot.staffCount) + " staff, " +
                           (snapshot.isCompliant ? "compliant" : "NON-COMPLIANT") + ".");
    return id;
}

RecordOutcome SnapshotStore::attempt(const RecordRequest& request) {
    RecordOutcome outcome;
    outcome.ageGroup = request.ageGroup;
    outcome.room = request.room;
    try {
        outcome.snapshotId = record(request);
        outcome.message = "recorded";
    } catch (const ComplianceError& ex) {
        outcome.error = ex.kind();
        outcome.message = ex.what();
        const std::string where =
            request.ageGroup + (request.room ? " in room " + *request.room : std::string());
        if (ex.kind() == ErrorKind::DuplicateSnapshot) {
            Logger::instance().log("Skipped " + where + ": " + ex.what());
        } else {
            Logger::instance().warn("Failed to record " + where + " (" + toString(ex.kind()) +
                                    "): " + ex.what());
        }
    }
    return outcome;
}

RecordBatch SnapshotStore::recordAll(SchoolPeriodId period,
                                     const Date& date,
                                     const TimeOfDay& time,
                                     std::optional<PersonId> recordedBy,
                                     bool isAutomatic) {
    RecordBatch batch;
    for (const auto& ageGroup : m_monitor.calculator().policy().ageGroups()) {
        RecordRequest request;
        request.period = period;
        request.ageGroup = ageGroup;
        request.date = date;
        request.time = time;
        request.recordedBy = recordedBy;
        request.isAutomatic = isAutomatic;
        batch.outcomes.push_back(attempt(request));
    }
    return batch;
}

RecordBatch SnapshotStore::recordByRoom(SchoolPeriodId period,
                                        const Date& date,
                                        const TimeOfDay& time,
                                        std::optional<PersonId> recordedBy,
                                        bool isAutomatic) {
    RecordBatch batch;
    // Room discovery failing means there is nothing to iterate; it propagates.
    const std::vector<RoomAssignment> rooms =
        m_monitor.counters().scheduledRooms(period, date, time);
    for (const auto& assignment : rooms) {
        RecordRequest request;
        request.period = period;
        request.ageGroup = assignment.ageGroup;
        request.date = date;
        request.time = time;
        request.room = assignment.room;
        request.recordedBy = recordedBy;
        request.isAutomatic = isAutomatic;
        batch.outcomes.push_back(attempt(request));
    }
    return batch;
}

std::optional<RatioSnapshot> SnapshotStore::findById(SnapshotId id) {
    return m_repository.findById(id);
}

std::vector<RatioSnapshot> SnapshotStore::query(const SnapshotFilter& filter) {
    if (filter.dateFrom && filter.dateTo && *filter.dateTo < *filter.dateFrom) {
        throw InvalidParameters("Date range ends before it starts.");
    }
    return m_repository.query(filter);
}

std::vector<RatioSnapshot> SnapshotStore::byDate(SchoolPeriodId period, const Date& date) {
    SnapshotFilter filter;
    filter.period = period;
    filter.date = date;
    return query(filter);
}

std::vector<RatioSnapshot> SnapshotStore::byDateRange(SchoolPeriodId period,
                                                      const Date& from,
                                                      const Date& to) {
    SnapshotFilter filter;
    filter.period = period;
    filter.dateFrom = from;
    filter.dateTo = to;
    return query(filter);
}

std::vector<RatioSnapshot> SnapshotStore::byRoom(SchoolPeriodId period, const std::string& room) {
    SnapshotFilter filter;
    filter.period = period;
    filter.room = room;
    return query(filter);
}

std::vector<RatioSnapshot> SnapshotStore::byAgeGroup(SchoolPeriodId period,
                                                     const std::string& ageGroup) {
    SnapshotFilter filter;
    filter.period = period;
    filter.ageGroup = ageGroup;
    return query(filter);
}

std::vector<RatioSnapshot> SnapshotStore::byCompliance(SchoolPeriodId period, bool isCompliant) {
    SnapshotFilter filter;
    filter.period = period;
    filter.isCompliant = isCompliant;
    return query(filter);
}

std::vector<RatioSnapshot> SnapshotStore::byAlertSent(SchoolPeriodId period, bool alertSent) {
    SnapshotFilter filter;
    filter.period = period;
    filter.alertSent = alertSent;
    return query(filter);
}

std::vector<RatioSnapshot> SnapshotStore::nonCompliant(SchoolPeriodId period,
                                                       const std::optional<Date>& from,
                                                       const std::optional<Date>& to) {
    SnapshotFilter filter;
    filter.period = period;
    filter.isCompliant = false;
    filter.dateFrom = from;
    filter.dateTo = to;
    return query(filter);
}

std::vector<RatioSnapshot> SnapshotStore::latestPerAgeGroup(SchoolPeriodId period,
                                                            const Date& date) {
    // byDate is newest first, so the first aggregated row seen per age group
    // wins. Room rows share the age-group child count and would misreport it.
    std::map<std::string, RatioSnapshot> latest;
    for (auto& snapshot : byDate(period, date)) {
        if (snapshot.room) {
            continue;
        }
        latest.emplace(snapshot.ageGroup, std::move(snapshot));
    }
    std::vector<RatioSnapshot> result;
    result.reserve(latest.size());
    for (auto& entry : latest) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

std::vector<std::string> SnapshotStore::uniqueRooms(SchoolPeriodId period) {
    return m_repository.distinctRooms(period);
}

bool SnapshotStore::markAlertSent(SnapshotId id) {
    const bool found = m_repository.markAlertSent(id, m_clock());
    if (found) {
        Logger::instance().log("Alert marked as sent for ratio snapshot #" + std::to_string(id) + ".");
    } else {
        Logger::instance().warn("Cannot mark alert sent: no ratio snapshot #" + std::to_string(id) +
                                ".");
    }
    return found;
}

std::size_t SnapshotStore::deleteOlderThan(int days, const Date& today) {
    if (days < 0 || days > kMaxRetentionDays) {
        throw InvalidParameters("Retention horizon must be between 0 and " +
                                std::to_string(kMaxRetentionDays) + " days.");
    }
    const Date cutoff = today.addDays(-static_cast<long long>(days));
    const std::size_t removed = m_repository.deleteBefore(cutoff);
    Logger::instance().log("Retention purge removed " + std::to_string(removed) +
                           " ratio snapshot(s) dated before " + cutoff.toString() + ".");
    return removed;
}

}  // namespace compliance
