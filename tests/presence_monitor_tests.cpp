// File: presence_monitor_tests.cpp
// Description: Staff/child headcounts and live ratio evaluation over a
//              scripted presence source.

#include "test_support.hpp"

using compliance::Date;
using compliance::TimeOfDay;
using testing_support::ComplianceStack;
using testing_support::kPeriod;

static const Date kDay = Date::parse("2025-03-01");
static const TimeOfDay kTen = TimeOfDay::parse("10:00");

static int test_staff_on_break_not_counted(void)
{
    ComplianceStack stack;
    stack.presence.addStaff(1, "Toddler");
    stack.presence.addStaff(2, "Toddler", std::nullopt, true);
    EXPECT(stack.counters.staffCountForAgeGroup(kPeriod, "Toddler", kDay, kTen) == 1,
           "staff on break excluded");
    return 0;
}

static int test_staff_outside_duty_window_not_counted(void)
{
    ComplianceStack stack;
    stack.presence.shifts.push_back(compliance::OpenShift{1, false});
    stack.presence.addDuty(1, "Toddler", std::nullopt, "10:00", "12:00");
    stack.presence.shifts.push_back(compliance::OpenShift{2, false});
    stack.presence.addDuty(2, "Toddler", std::nullopt, "10:01", "12:00");
    stack.presence.shifts.push_back(compliance::OpenShift{3, false});
    stack.presence.addDuty(3, "Toddler", std::nullopt, "08:00", "10:00");
    stack.presence.shifts.push_back(compliance::OpenShift{4, false});
    stack.presence.addDuty(4, "Toddler", std::nullopt, "08:00", "12:00", true);
    EXPECT(stack.counters.staffCountForAgeGroup(kPeriod, "Toddler", kDay, kTen) == 2,
           "window edges inclusive, later start and cancelled duty excluded");
    return 0;
}

static int test_staff_needs_open_shift_and_matching_group(void)
{
    ComplianceStack stack;
    stack.presence.addDuty(1, "Toddler", std::nullopt, "07:00", "17:00");
    stack.presence.addStaff(2, "Infant");
    EXPECT(stack.counters.staffCountForAgeGroup(kPeriod, "Toddler", kDay, kTen) == 0,
           "scheduled but not clocked in, or other group, not counted");
    return 0;
}

static int test_staff_counted_once_with_several_duties(void)
{
    ComplianceStack stack;
    stack.presence.addStaff(1, "Preschool", std::string("Sunflower"));
    stack.presence.addDuty(1, "Preschool", std::string("Daisy"), "09:00", "11:00");
    EXPECT(stack.counters.staffCountForAgeGroup(kPeriod, "Preschool", kDay, kTen) == 1,
           "distinct staff per age group");
    EXPECT(stack.counters.staffCountForAgeGroup(kPeriod, "Preschool", kDay, kTen,
                                                std::string("Daisy")) == 1,
           "room-scoped count");
    EXPECT(stack.counters.staffCountForAgeGroup(kPeriod, "Preschool", kDay, kTen,
                                                std::string("Tulip")) == 0,
           "no duty in that room");
    return 0;
}

static int test_children_filtered_by_age_band(void)
{
    ComplianceStack stack;
    stack.presence.addChild(10, testing_support::kInfantDob);
    stack.presence.addChild(11, testing_support::kToddlerDob);
    stack.presence.addChild(12, testing_support::kToddlerDob);
    stack.presence.addChild(13, testing_support::kPreschoolDob);
    stack.presence.addChild(14, testing_support::kSchoolAgeDob);
    stack.presence.checkIns.push_back(compliance::OpenCheckIn{15, "2025-03-01 08:00:00", std::nullopt});
    stack.presence.addChild(16, "2023-09-01");  // turns 18 months on the day
    EXPECT(stack.counters.childCountForAgeGroup(kPeriod, "Infant", kDay, kTen) == 1, "one infant");
    EXPECT(stack.counters.childCountForAgeGroup(kPeriod, "Toddler", kDay, kTen) == 3,
           "two toddlers plus the 18-month birthday");
    EXPECT(stack.counters.childCountForAgeGroup(kPeriod, "Preschool", kDay, kTen) == 1,
           "one preschooler");
    EXPECT(stack.counters.childCountForAgeGroup(kPeriod, "School Age", kDay, kTen) == 1,
           "one school-age child; unknown birth date never counted");
    return 0;
}

static int test_room_child_count_is_age_group_wide(void)
{
    ComplianceStack stack;
    EXPECT(!stack.counters.roomChildCountingSupported(), "room child counting flagged unsupported");
    stack.presence.addChild(10, testing_support::kToddlerDob);
    stack.presence.addChild(11, testing_support::kToddlerDob);
    EXPECT(stack.counters.childCountForAgeGroup(kPeriod, "Toddler", kDay, kTen,
                                                std::string("Daisy")) == 2,
           "room scope reuses age-group count");
    return 0;
}

static int test_unknown_age_group_child_count(void)
{
    ComplianceStack stack;
    bool raised = false;
    try {
        stack.counters.childCountForAgeGroup(kPeriod, "Kindergarten", kDay, kTen);
    } catch (const compliance::UnknownAgeGroup&) {
        raised = true;
    }
    EXPECT(raised, "no age band for unknown group");
    return 0;
}

static int test_unavailable_source_propagates(void)
{
    ComplianceStack stack;
    stack.presence.unavailable = true;
    bool staffRaised = false;
    bool childRaised = false;
    bool monitorRaised = false;
    try {
        stack.counters.staffCountForAgeGroup(kPeriod, "Toddler", kDay, kTen);
    } catch (const compliance::DataUnavailable&) {
        staffRaised = true;
    }
    try {
        stack.counters.childCountForAgeGroup(kPeriod, "Toddler", kDay, kTen);
    } catch (const compliance::DataUnavailable&) {
        childRaised = true;
    }
    try {
        stack.monitor.currentRatios(kPeriod, kDay, kTen);
    } catch (const compliance::DataUnavailable&) {
        monitorRaised = true;
    }
    EXPECT(staffRaised, "staff count never reports zero on failure");
    EXPECT(childRaised, "child count never reports zero on failure");
    EXPECT(monitorRaised, "live ratios propagate failure");
    return 0;
}

static int test_current_ratio(void)
{
    ComplianceStack stack;
    stack.presence.addStaff(1, "Toddler");
    stack.presence.addStaff(2, "Toddler");
    for (compliance::PersonId id = 100; id < 115; ++id) {
        stack.presence.addChild(id, testing_support::kToddlerDob);
    }
    const auto evaluation = stack.monitor.currentRatio(kPeriod, "Toddler", kDay, kTen);
    EXPECT(evaluation.staffCount == 2 && evaluation.childCount == 15, "counts from presence");
    EXPECT(evaluation.isCompliant, "15 toddlers with 2 staff is compliant");
    EXPECT(evaluation.calculatedAt == "2025-03-01 10:00:00", "evaluation stamped with query time");
    EXPECT(!evaluation.room, "aggregated evaluation has no room");
    return 0;
}

static int test_unknown_group_checked_before_presence(void)
{
    ComplianceStack stack;
    bool raised = false;
    try {
        stack.monitor.currentRatio(kPeriod, "Kindergarten", kDay, kTen);
    } catch (const compliance::UnknownAgeGroup&) {
        raised = true;
    }
    EXPECT(raised, "unknown age group raised");
    EXPECT(stack.presence.reads == 0, "no presence query issued for a policy gap");
    return 0;
}

static int test_ratios_by_room_and_shortfall(void)
{
    ComplianceStack stack;
    stack.presence.addStaff(1, "Infant", std::string("Nest"));
    stack.presence.addStaff(2, "Preschool", std::string("Daisy"));
    stack.presence.addDuty(3, "Preschool", std::string("Annex"), "07:00", "17:00");
    for (compliance::PersonId id = 100; id < 107; ++id) {
        stack.presence.addChild(id, testing_support::kInfantDob);
    }

    const auto rooms = stack.monitor.currentRatiosByRoom(kPeriod, kDay, kTen);
    EXPECT(rooms.size() == 3, "one evaluation per scheduled room");
    EXPECT(rooms[0].room == std::string("Annex") && rooms[1].room == std::string("Daisy") &&
               rooms[2].room == std::string("Nest"),
           "rooms ordered by name");
    EXPECT(rooms[0].staffCount == 0, "scheduled but not clocked in");
    EXPECT(rooms[2].childCount == 7 && !rooms[2].isCompliant, "7 infants with 1 staff breach");

    const auto shortfall = stack.monitor.staffingShortfall(kPeriod, kDay, kTen);
    EXPECT(shortfall.details.size() == 4, "one detail per configured age group");
    EXPECT(shortfall.details[0].ageGroup == "Infant", "policy order");
    EXPECT(shortfall.totalStaffNeeded == 1, "one more infant educator needed");
    EXPECT(!shortfall.overallCompliant, "overall non-compliant");
    return 0;
}

static int test_empty_room_name_rejected(void)
{
    ComplianceStack stack;
    bool raised = false;
    try {
        stack.monitor.currentRatio(kPeriod, "Toddler", kDay, kTen, std::string());
    } catch (const compliance::InvalidParameters&) {
        raised = true;
    }
    EXPECT(raised, "empty room name rejected");
    return 0;
}

static int test_counters_outlive_temporary_policy(void)
{
    testing_support::FakePresenceSource presence;
    presence.addChild(10, testing_support::kInfantDob);
    presence.addChild(11, testing_support::kToddlerDob);
    compliance::PresenceCounters counters(
        presence, compliance::RatioPolicy::parse("Nursery=3@0-24;Juniors=12@24-"));
    EXPECT(counters.childCountForAgeGroup(kPeriod, "Nursery", kDay, kTen) == 1,
           "age band read from the copied policy");
    EXPECT(counters.childCountForAgeGroup(kPeriod, "Juniors", kDay, kTen) == 1,
           "open-ended band from the copied policy");
    return 0;
}

int main(void)
{
    if (test_staff_on_break_not_counted() != 0) return 1;
    if (test_staff_outside_duty_window_not_counted() != 0) return 1;
    if (test_staff_needs_open_shift_and_matching_group() != 0) return 1;
    if (test_staff_counted_once_with_several_duties() != 0) return 1;
    if (test_children_filtered_by_age_band() != 0) return 1;
    if (test_room_child_count_is_age_group_wide() != 0) return 1;
    if (test_unknown_age_group_child_count() != 0) return 1;
    if (test_unavailable_source_propagates() != 0) return 1;
    if (test_current_ratio() != 0) return 1;
    if (test_unknown_group_checked_before_presence() != 0) return 1;
    if (test_ratios_by_room_and_shortfall() != 0) return 1;
    if (test_empty_room_name_rejected() != 0) return 1;
    if (test_counters_outlive_temporary_policy() != 0) return 1;
    return 0;
}
