// File: MySqlStorage.hpp
// Description: Declares the MySQL-backed presence source (host attendance,
//              time-entry and schedule tables) and snapshot repository.

#pragma once

#include "compliance/MySqlSession.hpp"
#include "compliance/Presence.hpp"
#include "compliance/SnapshotRepository.hpp"
#include "compliance/SnapshotRows.hpp"

#include <string>
#include <vector>

namespace compliance {

// Reads gibbonCareAttendance/gibbonPerson, gibbonStaffTimeEntry and
// gibbonStaffSchedule. Every failure surfaces as DataUnavailable.
class MySqlPresenceSource : public PresenceSource {
public:
    explicit MySqlPresenceSource(MySqlSession& session);

    std::vector<OpenCheckIn> openCheckIns(SchoolPeriodId period, const Date& date) override;
    std::vector<OpenShift> openShifts(SchoolPeriodId period, const Date& date) override;
    std::vector<DutyAssignment> dutySchedule(SchoolPeriodId period, const Date& date) override;

private:
    std::vector<MySqlRow> fetch(const std::string& sql, const char* action);

    MySqlSession& m_session;
};

// Persists snapshots in gibbonStaffRatioSnapshot. Uniqueness is a UNIQUE KEY
// over (period, age group, IFNULL(room, ''), date, time); a conflicting insert
// is reported as DuplicateSnapshot.
class MySqlSnapshotRepository : public SnapshotRepository {
public:
    explicit MySqlSnapshotRepository(MySqlSession& session);

    // Creates the snapshot table when it does not exist yet.
    void ensureSchema();

    SnapshotId insert(const RatioSnapshot& snapshot) override;
    std::optional<RatioSnapshot> findById(SnapshotId id) override;
    std::vector<RatioSnapshot> query(const SnapshotFilter& filter) override;
    bool markAlertSent(SnapshotId id, const std::string& sentAt) override;
    std::size_t deleteBefore(const Date& cutoff) override;
    std::vector<std::string> distinctRooms(SchoolPeriodId period) override;

private:
    std::vector<RatioSnapshot> select(const std::string& whereClause);

    MySqlSession& m_session;
};

}  // namespace compliance
