// File: snapshot_rows_tests.cpp
// Description: Snapshot table row mapping: the stored ratio for the
//              unbounded case, NULL columns and insert conflict errors.

#include "test_support.hpp"

#include "compliance/SnapshotRows.hpp"

using compliance::ActualRatio;
using compliance::MySqlRow;
using compliance::RatioSnapshot;
using testing_support::makeSnapshot;
using testing_support::nearlyEqual;

static MySqlRow storedRow(const std::optional<std::string>& room,
                          const std::string& staff,
                          const std::string& children,
                          const std::string& actualRatio,
                          const std::string& compliant)
{
    return MySqlRow{
        std::string("7"), std::string("25"), std::string("2025-03-01"), std::string("10:00:00"),
        std::string("Infant"), room, staff, children, std::string("5"), actualRatio, compliant,
        std::string("140.00"), std::string("N"), std::nullopt, std::nullopt, std::string("Y"),
        std::nullopt};
}

static int test_unbounded_ratio_round_trip(void)
{
    const RatioSnapshot unstaffed = makeSnapshot("2025-03-01", "10:00", "Infant", 0, 4, 5);
    const double stored = compliance::storedRatioValue(unstaffed.actualRatio);
    EXPECT(nearlyEqual(stored, 999.99), "unbounded ratio stored as 999.99");
    EXPECT(compliance::formatDecimal(stored) == "999.99", "decimal text for the column");

    const RatioSnapshot back =
        compliance::snapshotFromRow(storedRow(std::nullopt, "0", "4", "999.99", "N"));
    EXPECT(back.actualRatio.isUnbounded(), "read back as unbounded");
    EXPECT(back.actualRatio == unstaffed.actualRatio, "same ratio value as recorded");
    EXPECT(!back.isCompliant, "breach flag kept");
    return 0;
}

static int test_finite_ratio_capped_below_sentinel(void)
{
    EXPECT(nearlyEqual(compliance::storedRatioValue(ActualRatio::finite(1200.0)), 999.98),
           "huge finite ratio capped at 999.98");
    EXPECT(nearlyEqual(compliance::storedRatioValue(ActualRatio::finite(7.5)), 7.5),
           "ordinary ratio unchanged");

    const RatioSnapshot back =
        compliance::snapshotFromRow(storedRow(std::nullopt, "1", "999", "999.98", "N"));
    EXPECT(!back.actualRatio.isUnbounded(), "capped value stays finite");
    EXPECT(nearlyEqual(back.actualRatio.value(), 999.98), "capped value read back");

    const RatioSnapshot empty =
        compliance::snapshotFromRow(storedRow(std::nullopt, "0", "0", "0.00", "Y"));
    EXPECT(!empty.actualRatio.isUnbounded() && empty.isCompliant, "empty group is finite and compliant");
    return 0;
}

static int test_null_columns_mapped(void)
{
    const RatioSnapshot aggregated =
        compliance::snapshotFromRow(storedRow(std::nullopt, "2", "7", "3.50", "Y"));
    EXPECT(!aggregated.room, "NULL room is the aggregated row");
    EXPECT(!aggregated.alertSentTime && !aggregated.notes && !aggregated.recordedBy,
           "NULL optional columns stay empty");
    EXPECT(aggregated.id == 7u && aggregated.period == 25u, "identity columns");
    EXPECT(aggregated.snapshotTime == compliance::TimeOfDay::parse("10:00"), "time column");
    EXPECT(nearlyEqual(aggregated.compliancePercent, 140.0), "percent column");

    const RatioSnapshot named =
        compliance::snapshotFromRow(storedRow(std::string("Nest"), "2", "7", "3.50", "Y"));
    EXPECT(named.room == std::string("Nest"), "room name kept");

    bool raised = false;
    MySqlRow broken = storedRow(std::nullopt, "2", "7", "3.50", "Y");
    broken[4] = std::nullopt;
    try {
        compliance::snapshotFromRow(broken);
    } catch (const compliance::StorageFailure&) {
        raised = true;
    }
    EXPECT(raised, "NULL in a required column is a storage failure");

    raised = false;
    try {
        compliance::snapshotFromRow(MySqlRow{std::string("7")});
    } catch (const compliance::StorageFailure&) {
        raised = true;
    }
    EXPECT(raised, "short row rejected");
    return 0;
}

static int test_insert_conflict_mapping(void)
{
    const RatioSnapshot snapshot =
        makeSnapshot("2025-03-01", "10:00", "Infant", 1, 3, 5, std::string("Nest"));

    bool duplicate = false;
    try {
        compliance::throwInsertFailure(snapshot, true, 1062, "Duplicate entry");
    } catch (const compliance::DuplicateSnapshot& ex) {
        duplicate = ex.kind() == compliance::ErrorKind::DuplicateSnapshot;
    }
    EXPECT(duplicate, "unique-key conflict becomes DuplicateSnapshot");

    bool storage = false;
    try {
        compliance::throwInsertFailure(snapshot, false, 1406, "Data too long");
    } catch (const compliance::StorageFailure& ex) {
        storage = ex.kind() == compliance::ErrorKind::StorageFailure;
    }
    EXPECT(storage, "other insert errors become StorageFailure");
    return 0;
}

int main(void)
{
    if (test_unbounded_ratio_round_trip() != 0) return 1;
    if (test_finite_ratio_capped_below_sentinel() != 0) return 1;
    if (test_null_columns_mapped() != 0) return 1;
    if (test_insert_conflict_mapping() != 0) return 1;
    return 0;
}
