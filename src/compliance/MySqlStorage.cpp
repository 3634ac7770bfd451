// File: MySqlStorage.cpp
// Description: Implements the MySQL presence source and snapshot repository.

#include "compliance/MySqlStorage.hpp"

#include "compliance/Errors.hpp"
#include "compliance/Logger.hpp"
#include "compliance/SnapshotRows.hpp"

#include <mysqld_error.h>

#include <cstdlib>
#include <sstream>

namespace compliance {

namespace {

constexpr const char* kSnapshotTable = "gibbonStaffRatioSnapshot";

const char* yesNo(bool value) {
    return value ? "'Y'" : "'N'";
}

std::optional<Date> dateOrEmpty(const std::optional<std::string>& value) {
    if (!value || value->size() != 10) {
        return std::nullopt;
    }
    const int year = std::atoi(value->substr(0, 4).c_str());
    const int month = std::atoi(value->substr(5, 2).c_str());
    const int day = std::atoi(value->substr(8, 2).c_str());
    if (!Date::isValid(year, month, day)) {
        return std::nullopt;
    }
    return Date{year, month, day};
}

}  // namespace

MySqlPresenceSource::MySqlPresenceSource(MySqlSession& session) : m_session(session) {}

std::vector<MySqlRow> MySqlPresenceSource::fetch(const std::string& sql, const char* action) {
    return m_session.select(sql, [action](unsigned int err, const std::string& message) {
        throw DataUnavailable(std::string(action) + " failed (MySQL error " + std::to_string(err) +
                              "): " + message);
    });
}

std::vector<OpenCheckIn> MySqlPresenceSource::openCheckIns(SchoolPeriodId period, const Date& date) {
    std::ostringstream sql;
    sql << "SELECT a.gibbonPersonID, a.checkInTime, p.dob"
        << " FROM gibbonCareAttendance a"
        << " INNER JOIN gibbonPerson p ON a.gibbonPersonID=p.gibbonPersonID"
        << " WHERE a.gibbonSchoolYearID=" << period
        << " AND a.date=" << m_session.quote(date.toString())
        << " AND a.checkInTime IS NOT NULL"
        << " AND a.checkOutTime IS NULL";

    std::vector<OpenCheckIn> checkIns;
    for (const auto& row : fetch(sql.str(), "openCheckIns")) {
        OpenCheckIn checkIn;
        checkIn.personId = static_cast<PersonId>(columnToInteger(requiredColumn(row, 0)));
        checkIn.checkInTime = row[1].value_or("");
        checkIn.dob = dateOrEmpty(row[2]);
        if (!checkIn.dob) {
            Logger::instance().warn("Child #" + std::to_string(checkIn.personId) +
                                    " is checked in without a usable date of birth; not counted.");
        }
        checkIns.push_back(std::move(checkIn));
    }
    return checkIns;
}

std::vector<OpenShift> MySqlPresenceSource::openShifts(SchoolPeriodId period, const Date& date) {
    std::ostringstream sql;
    sql << "SELECT gibbonPersonID,"
        << " IF(breakStart IS NOT NULL AND breakEnd IS NULL, 1, 0) AS onBreak"
        << " FROM gibbonStaffTimeEntry"
        << " WHERE gibbonSchoolYearID=" << period
        << " AND date=" << m_session.quote(date.toString())
        << " AND clockInTime IS NOT NULL"
        << " AND clockOutTime IS NULL"
        << " AND status='Active'";

    std::vector<OpenShift> shifts;
    for (const auto& row : fetch(sql.str(), "openShifts")) {
        OpenShift shift;
        shift.personId = static_cast<PersonId>(columnToInteger(requiredColumn(row, 0)));
        shift.onBreak = requiredColumn(row, 1) == "1";
        shifts.push_back(shift);
    }
    return shifts;
}

std::vector<DutyAssignment> MySqlPresenceSource::dutySchedule(SchoolPeriodId period,
                                                              const Date& date) {
    std::ostringstream sql;
    sql << "SELECT gibbonPersonID, ageGroup, roomAssignment, startTime, endTime,"
        << " IF(status='Cancelled', 1, 0) AS cancelled"
        << " FROM gibbonStaffSchedule"
        << " WHERE gibbonSchoolYearID=" << period
        << " AND date=" << m_session.quote(date.toString())
        << " ORDER BY roomAssignment";

    std::vector<DutyAssignment> schedule;
    for (const auto& row : fetch(sql.str(), "dutySchedule")) {
        DutyAssignment duty;
        duty.personId = static_cast<PersonId>(columnToInteger(requiredColumn(row, 0)));
        duty.ageGroup = row[1];
        duty.room = row[2];
        try {
            duty.startTime = TimeOfDay::parse(requiredColumn(row, 3));
            duty.endTime = TimeOfDay::parse(requiredColumn(row, 4));
        } catch (const InvalidParameters& ex) {
            throw DataUnavailable("Unreadable schedule row for staff #" +
                                  std::to_string(duty.personId) + ": " + ex.what());
        }
        duty.cancelled = requiredColumn(row, 5) == "1";
        schedule.push_back(std::move(duty));
    }
    return schedule;
}

MySqlSnapshotRepository::MySqlSnapshotRepository(MySqlSession& session) : m_session(session) {}

void MySqlSnapshotRepository::ensureSchema() {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS `" << kSnapshotTable << "` ("
        << " `gibbonStaffRatioSnapshotID` INT UNSIGNED AUTO_INCREMENT PRIMARY KEY,"
        << " `gibbonSchoolYearID` INT UNSIGNED NOT NULL,"
        << " `snapshotDate` DATE NOT NULL,"
        << " `snapshotTime` TIME NOT NULL,"
        << " `ageGroup` VARCHAR(50) NOT NULL,"
        << " `roomName` VARCHAR(100) NULL,"
        << " `roomKey` VARCHAR(100) AS (IFNULL(`roomName`, '')) STORED,"
        << " `staffCount` INT UNSIGNED NOT NULL DEFAULT 0,"
        << " `childCount` INT UNSIGNED NOT NULL DEFAULT 0,"
        << " `requiredRatio` INT UNSIGNED NOT NULL,"
        << " `actualRatio` DECIMAL(7,2) NOT NULL,"
        << " `isCompliant` ENUM('Y','N') NOT NULL DEFAULT 'Y',"
        << " `compliancePercent` DECIMAL(7,2) NULL,"
        << " `alertSent` ENUM('Y','N') NOT NULL DEFAULT 'N',"
        << " `alertSentTime` DATETIME NULL,"
        << " `notes` TEXT NULL,"
        << " `recordedByID` INT UNSIGNED NULL,"
        << " `isAutomatic` ENUM('Y','N') NOT NULL DEFAULT 'Y',"
        << " `timestampCreated` TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
        << " UNIQUE KEY `snapshotKey` (`gibbonSchoolYearID`, `ageGroup`, `roomKey`,"
        << " `snapshotDate`, `snapshotTime`),"
        << " KEY `snapshotDate` (`snapshotDate`),"
        << " KEY `isCompliant` (`isCompliant`)"
        << ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_unicode_ci";

    m_session.execute(sql.str(), [](unsigned int err, const std::string& message) {
        throw StorageFailure("Creating ratio snapshot table failed (MySQL error " +
                             std::to_string(err) + "): " + message);
    });
}

SnapshotId MySqlSnapshotRepository::insert(const RatioSnapshot& snapshot) {
    std::ostringstream sql;
    sql << "INSERT INTO `" << kSnapshotTable << "` (gibbonSchoolYearID, snapshotDate, snapshotTime,"
        << " ageGroup, roomName, staffCount, childCount, requiredRatio, actualRatio, isCompliant,"
        << " compliancePercent, notes, recordedByID, isAutomatic) VALUES ("
        << snapshot.period << ","
        << m_session.quote(snapshot.snapshotDate.toString()) << ","
        << m_session.quote(snapshot.snapshotTime.toString()) << ","
        << m_session.quote(snapshot.ageGroup) << ","
        << m_session.quoteOrNull(snapshot.room) << ","
        << snapshot.staffCount << ","
        << snapshot.childCount << ","
        << snapshot.requiredRatio << ","
        << formatDecimal(storedRatioValue(snapshot.actualRatio)) << ","
        << yesNo(snapshot.isCompliant) << ","
        << formatDecimal(snapshot.compliancePercent) << ","
        << m_session.quoteOrNull(snapshot.notes) << ","
        << (snapshot.recordedBy ? std::to_string(*snapshot.recordedBy) : std::string("NULL")) << ","
        << yesNo(snapshot.isAutomatic) << ")";

    const auto result =
        m_session.execute(sql.str(), [&snapshot](unsigned int err, const std::string& message) {
            throwInsertFailure(snapshot, err == ER_DUP_ENTRY, err, message);
        });
    return static_cast<SnapshotId>(result.insertId);
}

std::vector<RatioSnapshot> MySqlSnapshotRepository::select(const std::string& whereClause) {
    std::ostringstream sql;
    sql << "SELECT " << snapshotColumns() << " FROM `" << kSnapshotTable << "`";
    if (!whereClause.empty()) {
        sql << " WHERE " << whereClause;
    }
    sql << " ORDER BY snapshotDate DESC, snapshotTime DESC, gibbonStaffRatioSnapshotID DESC";

    const auto rows = m_session.select(sql.str(), [](unsigned int err, const std::string& message) {
        throw StorageFailure("Querying ratio snapshots failed (MySQL error " +
                             std::to_string(err) + "): " + message);
    });

    std::vector<RatioSnapshot> snapshots;
    snapshots.reserve(rows.size());
    for (const auto& row : rows) {
        snapshots.push_back(snapshotFromRow(row));
    }
    return snapshots;
}

std::optional<RatioSnapshot> MySqlSnapshotRepository::findById(SnapshotId id) {
    auto rows = select("gibbonStaffRatioSnapshotID=" + std::to_string(id));
    if (rows.empty()) {
        return std::nullopt;
    }
    return rows.front();
}

std::vector<RatioSnapshot> MySqlSnapshotRepository::query(const SnapshotFilter& filter) {
    std::vector<std::string> clauses;
    if (filter.period) {
        clauses.push_back("gibbonSchoolYearID=" + std::to_string(*filter.period));
    }
    if (filter.date) {
        clauses.push_back("snapshotDate=" + m_session.quote(filter.date->toString()));
    }
    if (filter.dateFrom) {
        clauses.push_back("snapshotDate>=" + m_session.quote(filter.dateFrom->toString()));
    }
    if (filter.dateTo) {
        clauses.push_back("snapshotDate<=" + m_session.quote(filter.dateTo->toString()));
    }
    if (filter.ageGroup) {
        clauses.push_back("ageGroup=" + m_session.quote(*filter.ageGroup));
    }
    if (filter.room) {
        clauses.push_back("roomName=" + m_session.quote(*filter.room));
    }
    if (filter.isCompliant) {
        clauses.push_back(std::string("isCompliant=") + yesNo(*filter.isCompliant));
    }
    if (filter.alertSent) {
        clauses.push_back(std::string("alertSent=") + yesNo(*filter.alertSent));
    }
    if (filter.isAutomatic) {
        clauses.push_back(std::string("isAutomatic=") + yesNo(*filter.isAutomatic));
    }

    std::string where;
    for (std::size_t i = 0; i < clauses.size(); ++i) {
        if (i > 0) {
            where += " AND ";
        }
        where += clauses[i];
    }
    return select(where);
}

bool MySqlSnapshotRepository::markAlertSent(SnapshotId id, const std::string& sentAt) {
    const auto onError = [](unsigned int err, const std::string& message) {
        throw StorageFailure("Marking alert sent failed (MySQL error " + std::to_string(err) +
                             "): " + message);
    };

    std::ostringstream sql;
    sql << "UPDATE `" << kSnapshotTable << "` SET alertSent='Y', alertSentTime="
        << m_session.quote(sentAt)
        << " WHERE gibbonStaffRatioSnapshotID=" << id << " AND alertSent='N'";
    if (m_session.execute(sql.str(), onError).affectedRows > 0) {
        return true;
    }

    // Either already acknowledged or missing.
    const auto rows = m_session.select(
        "SELECT COUNT(*) FROM `" + std::string(kSnapshotTable) +
            "` WHERE gibbonStaffRatioSnapshotID=" + std::to_string(id),
        onError);
    return !rows.empty() && columnToInteger(requiredColumn(rows.front(), 0)) > 0;
}

std::size_t MySqlSnapshotRepository::deleteBefore(const Date& cutoff) {
    const std::string sql = "DELETE FROM `" + std::string(kSnapshotTable) +
                            "` WHERE snapshotDate < " + m_session.quote(cutoff.toString());
    const auto result =
        m_session.execute(sql, [](unsigned int err, const std::string& message) {
            throw StorageFailure("Deleting old ratio snapshots failed (MySQL error " +
                                 std::to_string(err) + "): " + message);
        });
    return static_cast<std::size_t>(result.affectedRows);
}

std::vector<std::string> MySqlSnapshotRepository::distinctRooms(SchoolPeriodId period) {
    const std::string sql = "SELECT DISTINCT roomName FROM `" + std::string(kSnapshotTable) +
                            "` WHERE gibbonSchoolYearID=" + std::to_string(period) +
                            " AND roomName IS NOT NULL ORDER BY roomName";
    const auto rows = m_session.select(sql, [](unsigned int err, const std::string& message) {
        throw StorageFailure("Listing snapshot rooms failed (MySQL error " + std::to_string(err) +
                             "): " + message);
    });

    std::vector<std::string> rooms;
    rooms.reserve(rows.size());
    for (const auto& row : rows) {
        rooms.push_back(requiredColumn(row, 0));
    }
    return rooms;
}

}  // namespace compliance
