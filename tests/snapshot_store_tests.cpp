// File: snapshot_store_tests.cpp
// Description: Snapshot recording, atomic uniqueness, batch outcomes,
//              read-side queries and retention.

#include "test_support.hpp"

#include <atomic>
#include <thread>
#include <vector>

using compliance::Date;
using compliance::ErrorKind;
using compliance::RecordRequest;
using compliance::TimeOfDay;
using testing_support::ComplianceStack;
using testing_support::kPeriod;
using testing_support::makeSnapshot;

static const Date kDay = Date::parse("2025-03-01");

static RecordRequest preschoolAtTen(void)
{
    RecordRequest request;
    request.period = kPeriod;
    request.ageGroup = "Preschool";
    request.date = kDay;
    request.time = TimeOfDay::parse("10:00");
    return request;
}

static void staffPreschool(ComplianceStack& stack)
{
    stack.presence.addStaff(1, "Preschool", std::string("Daisy"));
    for (compliance::PersonId id = 100; id < 108; ++id) {
        stack.presence.addChild(id, testing_support::kPreschoolDob);
    }
}

static int test_record_persists_evaluation(void)
{
    ComplianceStack stack;
    staffPreschool(stack);
    RecordRequest request = preschoolAtTen();
    request.recordedBy = 42;
    request.isAutomatic = false;
    request.notes = std::string("morning check");
    const compliance::SnapshotId id = stack.store.record(request);

    const auto stored = stack.store.findById(id);
    EXPECT(stored.has_value(), "snapshot stored");
    EXPECT(stored->staffCount == 1 && stored->childCount == 8, "counts copied");
    EXPECT(stored->requiredRatio == 10, "required ratio copied from policy");
    EXPECT(stored->isCompliant, "8 preschoolers with 1 staff is compliant");
    EXPECT(testing_support::nearlyEqual(stored->compliancePercent, 80.0), "percent copied");
    EXPECT(!stored->alertSent && !stored->alertSentTime, "alert not sent on insert");
    EXPECT(!stored->isAutomatic && stored->recordedBy == 42u, "manual recording attributed");
    EXPECT(stored->notes == std::string("morning check"), "notes kept");
    EXPECT(!stored->room, "aggregated snapshot has no room");
    EXPECT(!stack.store.findById(id + 100), "unknown id not found");
    return 0;
}

static int test_duplicate_record_rejected(void)
{
    ComplianceStack stack;
    staffPreschool(stack);
    stack.store.record(preschoolAtTen());
    bool raised = false;
    try {
        stack.store.record(preschoolAtTen());
    } catch (const compliance::DuplicateSnapshot& ex) {
        raised = ex.kind() == ErrorKind::DuplicateSnapshot;
    }
    EXPECT(raised, "second record with the same key raises DuplicateSnapshot");
    EXPECT(stack.repository.size() == 1, "exactly one row persisted");

    RecordRequest roomRequest = preschoolAtTen();
    roomRequest.room = std::string("Daisy");
    stack.store.record(roomRequest);
    RecordRequest later = preschoolAtTen();
    later.time = TimeOfDay::parse("10:00:01");
    stack.store.record(later);
    EXPECT(stack.repository.size() == 3, "room and time are part of the key");
    return 0;
}

static int test_concurrent_records_insert_once(void)
{
    ComplianceStack stack;
    staffPreschool(stack);
    std::atomic<int> recorded{0};
    std::atomic<int> duplicates{0};
    std::atomic<int> otherErrors{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&] {
            try {
                stack.store.record(preschoolAtTen());
                ++recorded;
            } catch (const compliance::DuplicateSnapshot&) {
                ++duplicates;
            } catch (const compliance::ComplianceError&) {
                ++otherErrors;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT(recorded == 1, "exactly one concurrent trigger wins");
    EXPECT(duplicates == 7, "every other trigger sees DuplicateSnapshot");
    EXPECT(otherErrors == 0, "no unexpected failures");
    EXPECT(stack.repository.size() == 1, "exactly one row persisted under concurrency");
    return 0;
}

static int test_record_all_reports_each_group(void)
{
    compliance::RatioPolicy policy({compliance::RatioPolicyEntry{"Infant", 5, 0, 18},
                                    compliance::RatioPolicyEntry{"Toddler", 8, 18, 36}});
    testing_support::FakePresenceSource presence;
    compliance::PresenceCounters counters(presence, policy);
    compliance::RatioCalculator calculator(policy);
    compliance::RatioMonitor monitor(counters, calculator);
    compliance::InMemorySnapshotRepository repository;
    compliance::SnapshotStore store(repository, monitor);

    presence.addStaff(1, "Toddler");
    const TimeOfDay ten = TimeOfDay::parse("10:00");

    // Infant already recorded for this slot; Toddler is new.
    repository.insert(makeSnapshot("2025-03-01", "10:00", "Infant", 0, 0, 5));

    const compliance::RecordBatch batch = store.recordAll(kPeriod, kDay, ten, std::nullopt, true);
    EXPECT(batch.outcomes.size() == 2, "one outcome per configured age group");
    EXPECT(batch.outcomes[0].ageGroup == "Infant" && !batch.outcomes[0].recorded(),
           "infant duplicate reported");
    EXPECT(batch.outcomes[0].error == ErrorKind::DuplicateSnapshot, "duplicate kind kept");
    EXPECT(batch.outcomes[1].ageGroup == "Toddler" && batch.outcomes[1].recorded(),
           "toddler still recorded");
    EXPECT(batch.recordedCount() == 1 && batch.failedCount() == 1, "counts per outcome");
    EXPECT(batch.hardFailureCount() == 0, "duplicates are not hard failures");
    return 0;
}

static int test_record_all_reports_unavailable_presence(void)
{
    ComplianceStack stack;
    stack.presence.unavailable = true;
    const compliance::RecordBatch batch =
        stack.store.recordAll(kPeriod, kDay, TimeOfDay::parse("10:00"), std::nullopt, true);
    EXPECT(batch.outcomes.size() == 4, "every age group attempted");
    EXPECT(batch.recordedCount() == 0, "nothing recorded without presence");
    EXPECT(batch.hardFailureCount() == 4, "failures never reported as success");
    EXPECT(batch.outcomes[2].error == ErrorKind::DataUnavailable, "failure kind reported");
    EXPECT(!batch.outcomes[2].message.empty(), "failure message reported");
    EXPECT(stack.repository.size() == 0, "no zero-count snapshots written");
    return 0;
}

static int test_record_by_room(void)
{
    ComplianceStack stack;
    stack.presence.addStaff(1, "Toddler", std::string("Bluebird"));
    stack.presence.addStaff(2, "Preschool", std::string("Acorn"));
    stack.presence.addDuty(3, "Preschool", std::string("Acorn"), "13:00", "17:00");
    const compliance::RecordBatch batch =
        stack.store.recordByRoom(kPeriod, kDay, TimeOfDay::parse("10:00"), 7, false);
    EXPECT(batch.outcomes.size() == 2, "one outcome per scheduled room");
    EXPECT(batch.outcomes[0].room == std::string("Acorn"), "rooms in name order");
    EXPECT(batch.recordedCount() == 2, "both rooms recorded");

    const auto rooms = stack.store.uniqueRooms(kPeriod);
    EXPECT(rooms.size() == 2 && rooms[0] == "Acorn" && rooms[1] == "Bluebird", "distinct rooms sorted");
    const auto acorn = stack.store.byRoom(kPeriod, "Acorn");
    EXPECT(acorn.size() == 1 && acorn[0].ageGroup == "Preschool", "room query");
    EXPECT(acorn[0].recordedBy == 7u && !acorn[0].isAutomatic, "batch attribution applied");
    return 0;
}

static int test_latest_ignores_room_rows_recorded_alongside(void)
{
    ComplianceStack stack;
    stack.presence.addStaff(1, "Preschool", std::string("Acorn"));
    stack.presence.addStaff(2, "Preschool", std::string("Birch"));
    for (compliance::PersonId id = 100; id < 115; ++id) {
        stack.presence.addChild(id, testing_support::kPreschoolDob);
    }
    const TimeOfDay ten = TimeOfDay::parse("10:00");
    EXPECT(stack.store.recordAll(kPeriod, kDay, ten, std::nullopt, true).hardFailureCount() == 0,
           "age groups recorded");
    const auto rooms = stack.store.recordByRoom(kPeriod, kDay, ten, std::nullopt, true);
    EXPECT(rooms.recordedCount() == 2, "both rooms recorded at the same instant");

    const auto acorn = stack.store.byRoom(kPeriod, "Acorn");
    EXPECT(acorn.size() == 1 && !acorn[0].isCompliant, "single room staff breaches on its own");

    const auto latest = stack.store.latestPerAgeGroup(kPeriod, kDay);
    bool foundPreschool = false;
    for (const auto& snapshot : latest) {
        EXPECT(!snapshot.room, "only aggregated rows returned");
        if (snapshot.ageGroup == "Preschool") {
            foundPreschool = true;
            EXPECT(snapshot.staffCount == 2 && snapshot.childCount == 15, "aggregated counts");
            EXPECT(snapshot.isCompliant, "15 preschoolers with 2 staff is compliant");
        }
    }
    EXPECT(foundPreschool, "preschool present in latest rows");
    EXPECT(latest.size() == 4, "one row per configured age group");
    return 0;
}

static int test_no_room_key_distinct_from_any_room_name(void)
{
    ComplianceStack stack;
    stack.repository.insert(makeSnapshot("2025-03-01", "10:00", "Infant", 1, 3, 5));
    stack.repository.insert(makeSnapshot("2025-03-01", "10:00", "Infant", 1, 3, 5, std::string(1, '\x01')));
    stack.repository.insert(makeSnapshot("2025-03-01", "10:00", "Infant", 1, 3, 5, std::string("Nest")));
    EXPECT(stack.repository.size() == 3, "aggregated row and unusual room names coexist");

    bool raised = false;
    try {
        stack.repository.insert(makeSnapshot("2025-03-01", "10:00", "Infant", 1, 3, 5, std::string(1, '\x01')));
    } catch (const compliance::DuplicateSnapshot&) {
        raised = true;
    }
    EXPECT(raised, "same room name still unique");
    return 0;
}

static int test_queries_and_latest(void)
{
    ComplianceStack stack;
    stack.repository.insert(makeSnapshot("2025-03-01", "09:00", "Toddler", 1, 6, 8));
    stack.repository.insert(makeSnapshot("2025-03-01", "11:00", "Toddler", 1, 9, 8));
    stack.repository.insert(makeSnapshot("2025-03-01", "10:00", "Infant", 2, 7, 5));
    stack.repository.insert(makeSnapshot("2025-03-02", "10:00", "Infant", 1, 6, 5));
    stack.repository.insert(makeSnapshot("2025-02-27", "10:00", "Infant", 1, 4, 5));

    const auto day = stack.store.byDate(kPeriod, kDay);
    EXPECT(day.size() == 3, "three rows on the day");
    EXPECT(day[0].snapshotTime == TimeOfDay::parse("11:00"), "newest first");

    const auto latest = stack.store.latestPerAgeGroup(kPeriod, kDay);
    EXPECT(latest.size() == 2, "one row per age group");
    EXPECT(latest[0].ageGroup == "Infant" && latest[1].ageGroup == "Toddler", "ordered by age group");
    EXPECT(latest[1].snapshotTime == TimeOfDay::parse("11:00"), "latest toddler row");

    const auto breaches = stack.store.nonCompliant(kPeriod);
    EXPECT(breaches.size() == 2, "two breaches overall");
    EXPECT(stack.store.nonCompliant(kPeriod, kDay, kDay).size() == 1, "one breach on the day");
    EXPECT(stack.store.byDateRange(kPeriod, Date::parse("2025-02-28"), kDay).size() == 3,
           "inclusive date range");
    EXPECT(stack.store.byAgeGroup(kPeriod, "Infant").size() == 3, "age group query");
    EXPECT(stack.store.byCompliance(kPeriod, true).size() == 3, "compliant rows");
    EXPECT(stack.store.byAlertSent(kPeriod, false).size() == 5, "no alerts sent yet");
    EXPECT(stack.store.byDate(kPeriod + 1, kDay).empty(), "other period is separate");

    bool raised = false;
    try {
        stack.store.byDateRange(kPeriod, kDay, Date::parse("2025-02-01"));
    } catch (const compliance::InvalidParameters&) {
        raised = true;
    }
    EXPECT(raised, "reversed range rejected");
    return 0;
}

static int test_mark_alert_sent_is_idempotent(void)
{
    ComplianceStack stack;
    const auto id = stack.repository.insert(makeSnapshot("2025-03-01", "10:00", "Infant", 1, 7, 5));
    EXPECT(stack.store.markAlertSent(id), "existing snapshot marked");
    EXPECT(stack.store.markAlertSent(id), "marking twice still succeeds");
    const auto stored = stack.store.findById(id);
    EXPECT(stored->alertSent, "alert flag set");
    EXPECT(stored->alertSentTime == std::string("2025-03-01 10:05:00"), "stamped from the clock");
    EXPECT(!stack.store.markAlertSent(id + 1), "unknown snapshot reported");
    return 0;
}

static int test_retention_purge(void)
{
    ComplianceStack stack;
    stack.repository.insert(makeSnapshot("2024-02-29", "10:00", "Infant", 1, 3, 5));
    stack.repository.insert(makeSnapshot("2024-03-01", "10:00", "Infant", 1, 3, 5));
    stack.repository.insert(makeSnapshot("2025-03-01", "10:00", "Infant", 1, 3, 5));
    const std::size_t removed = stack.store.deleteOlderThan(365, kDay);
    EXPECT(removed == 1, "only rows before the cutoff removed");
    EXPECT(stack.repository.size() == 2, "cutoff day kept");

    // The purged key can be recorded again.
    stack.repository.insert(makeSnapshot("2024-02-29", "10:00", "Infant", 1, 3, 5));
    EXPECT(stack.repository.size() == 3, "purged key reusable");

    bool raised = false;
    try {
        stack.store.deleteOlderThan(-1, kDay);
    } catch (const compliance::InvalidParameters&) {
        raised = true;
    }
    EXPECT(raised, "negative horizon rejected");

    raised = false;
    try {
        stack.store.deleteOlderThan(36501, kDay);
    } catch (const compliance::InvalidParameters&) {
        raised = true;
    }
    EXPECT(raised, "horizon beyond a century rejected");
    EXPECT(stack.store.deleteOlderThan(36500, kDay) == 0, "longest horizon accepted");
    return 0;
}

int main(void)
{
    if (test_record_persists_evaluation() != 0) return 1;
    if (test_duplicate_record_rejected() != 0) return 1;
    if (test_concurrent_records_insert_once() != 0) return 1;
    if (test_record_all_reports_each_group() != 0) return 1;
    if (test_record_all_reports_unavailable_presence() != 0) return 1;
    if (test_record_by_room() != 0) return 1;
    if (test_latest_ignores_room_rows_recorded_alongside() != 0) return 1;
    if (test_no_room_key_distinct_from_any_room_name() != 0) return 1;
    if (test_queries_and_latest() != 0) return 1;
    if (test_mark_alert_sent_is_idempotent() != 0) return 1;
    if (test_retention_purge() != 0) return 1;
    return 0;
}
