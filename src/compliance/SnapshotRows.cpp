// File: SnapshotRows.cpp
// Description: Row conversion for the ratio snapshot table.

#include "compliance/SnapshotRows.hpp"

#include "compliance/Errors.hpp"

#include <algorithm>
#include <cstdio>

namespace compliance {

const char* snapshotColumns() {
    return "gibbonStaffRatioSnapshotID, gibbonSchoolYearID, snapshotDate, snapshotTime, ageGroup, "
           "roomName, staffCount, childCount, requiredRatio, actualRatio, isCompliant, "
           "compliancePercent, alertSent, alertSentTime, notes, isAutomatic, recordedByID";
}

const std::string& requiredColumn(const MySqlRow& row, std::size_t index) {
    if (index >= row.size() || !row[index]) {
        throw StorageFailure("Unexpected NULL in column " + std::to_string(index) + ".");
    }
    return *row[index];
}

long long columnToInteger(const std::string& value) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        throw StorageFailure("Non-numeric value '" + value + "' returned by MySQL.");
    }
}

double columnToDecimal(const std::string& value) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw StorageFailure("Non-decimal value '" + value + "' returned by MySQL.");
    }
}

std::string formatDecimal(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return std::string(buffer);
}

double storedRatioValue(const ActualRatio& ratio) {
    if (ratio.isUnbounded()) {
        return kUnboundedRatioStorageValue;
    }
    return std::min(ratio.value(), kUnboundedRatioStorageValue - 0.01);
}

RatioSnapshot snapshotFromRow(const MySqlRow& row) {
    if (row.size() < 17) {
        throw StorageFailure("Snapshot row has " + std::to_string(row.size()) +
                             " columns, expected 17.");
    }
    RatioSnapshot snapshot;
    snapshot.id = static_cast<SnapshotId>(columnToInteger(requiredColumn(row, 0)));
    snapshot.period = static_cast<SchoolPeriodId>(columnToInteger(requiredColumn(row, 1)));
    snapshot.snapshotDate = Date::parse(requiredColumn(row, 2));
    snapshot.snapshotTime = TimeOfDay::parse(requiredColumn(row, 3));
    snapshot.ageGroup = requiredColumn(row, 4);
    snapshot.room = row[5];
    snapshot.staffCount = static_cast<int>(columnToInteger(requiredColumn(row, 6)));
    snapshot.childCount = static_cast<int>(columnToInteger(requiredColumn(row, 7)));
    snapshot.requiredRatio = static_cast<int>(columnToInteger(requiredColumn(row, 8)));
    if (snapshot.staffCount == 0 && snapshot.childCount > 0) {
        snapshot.actualRatio = ActualRatio::unbounded();
    } else {
        snapshot.actualRatio = ActualRatio::finite(columnToDecimal(requiredColumn(row, 9)));
    }
    snapshot.isCompliant = requiredColumn(row, 10) == "Y";
    snapshot.compliancePercent = row[11] ? columnToDecimal(*row[11]) : 0.0;
    snapshot.alertSent = requiredColumn(row, 12) == "Y";
    snapshot.alertSentTime = row[13];
    snapshot.notes = row[14];
    snapshot.isAutomatic = requiredColumn(row, 15) == "Y";
    if (row[16]) {
        snapshot.recordedBy = static_cast<PersonId>(columnToInteger(*row[16]));
    }
    return snapshot;
}

void throwInsertFailure(const RatioSnapshot& snapshot,
                        bool duplicateKey,
                        unsigned int err,
                        const std::string& message) {
    if (duplicateKey) {
        throw DuplicateSnapshot("Snapshot already recorded for " + describeKey(snapshot) + ".");
    }
    throw StorageFailure("Inserting ratio snapshot failed (MySQL error " + std::to_string(err) +
                         "): " + message);
}

}  // namespace compliance
