// File: SnapshotStore.hpp
// Description: Declares the snapshot store: records ratio evaluations as
//              immutable point-in-time snapshots and answers the read-side
//              queries the dashboard and alerting consumers need.

#pragma once

#include "compliance/Errors.hpp"
#include "compliance/RatioMonitor.hpp"
#include "compliance/SnapshotRepository.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace compliance {

struct RecordRequest {
    SchoolPeriodId period{0};
    std::string ageGroup;
    Date date;
    TimeOfDay time;
    std::optional<std::string> room;
    std::optional<PersonId> recordedBy;
    bool isAutomatic{true};
    std::optional<std::string> notes;
};

struct RecordOutcome {
    std::string ageGroup;
    std::optional<std::string> room;
    std::optional<SnapshotId> snapshotId;
    std::optional<ErrorKind> error;
    std::string message;

    bool recorded() const noexcept { return snapshotId.has_value(); }
};

// Per-entry results of recordAll / recordByRoom.
struct RecordBatch {
    std::vector<RecordOutcome> outcomes;

    std::size_t recordedCount() const;
    std::size_t failedCount() const;
    // Failures other than DuplicateSnapshot.
    std::size_t hardFailureCount() const;
};

class SnapshotStore {
public:
    using Clock = std::function<std::string()>;

    // clock supplies "YYYY-MM-DD HH:MM:SS" for alertSentTime; defaults to
    // local wall-clock time.
    SnapshotStore(SnapshotRepository& repository, RatioMonitor& monitor, Clock clock = Clock());

    // Evaluates presence now and inserts a snapshot. Throws DuplicateSnapshot
    // when the key already exists, DataUnavailable / UnknownAgeGroup from the
    // evaluation, InvalidParameters for an empty room name.
    SnapshotId record(const RecordRequest& request);

    RecordBatch recordAll(SchoolPeriodId period,
                          const Date& date,
                          const TimeOfDay& time,
                          std::optional<PersonId> recordedBy,
                          bool isAutomatic);

    RecordBatch recordByRoom(SchoolPeriodId period,
                             const Date& date,
                             const TimeOfDay& time,
                             std::optional<PersonId> recordedBy,
                             bool isAutomatic);

    std::optional<RatioSnapshot> findById(SnapshotId id);
    std::vector<RatioSnapshot> query(const SnapshotFilter& filter);
    std::vector<RatioSnapshot> byDate(SchoolPeriodId period, const Date& date);
    std::vector<RatioSnapshot> byDateRange(SchoolPeriodId period, const Date& from, const Date& to);
    std::vector<RatioSnapshot> byRoom(SchoolPeriodId period, const std::string& room);
    std::vector<RatioSnapshot> byAgeGroup(SchoolPeriodId period, const std::string& ageGroup);
    std::vector<RatioSnapshot> byCompliance(SchoolPeriodId period, bool isCompliant);
    std::vector<RatioSnapshot> byAlertSent(SchoolPeriodId period, bool alertSent);
    std::vector<RatioSnapshot> nonCompliant(SchoolPeriodId period,
                                            const std::optional<Date>& from = std::nullopt,
                                            const std::optional<Date>& to = std::nullopt);
    // Latest aggregated (room-less) snapshot of the day for each age group,
    // ordered by age group. Room-scoped rows are reachable through byRoom.
    std::vector<RatioSnapshot> latestPerAgeGroup(SchoolPeriodId period, const Date& date);
    std::vector<std::string> uniqueRooms(SchoolPeriodId period);

    // Idempotent; returns false when no snapshot has that id.
    bool markAlertSent(SnapshotId id);

    // Deletes snapshots dated before today - days. Never called implicitly.
    std::size_t deleteOlderThan(int days, const Date& today);

    SnapshotRepository& repository() noexcept { return m_repository; }

private:
    RecordOutcome attempt(const RecordRequest& request);

    SnapshotRepository& m_repository;
    RatioMonitor& m_monitor;
    Clock m_clock;
};

}  // namespace compliance
