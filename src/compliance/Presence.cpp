// File: Presence.cpp
// Description: Implements staff and child headcounts over the presence source.

#include "compliance/Presence.hpp"

#include "compliance/Errors.hpp"

#include <set>
#include <unordered_set>
#include <utility>

namespace compliance {

PresenceCounters::PresenceCounters(PresenceSource& source, const RatioPolicy& policy)
    : m_source(source), m_policy(policy) {}

int PresenceCounters::staffCountForAgeGroup(SchoolPeriodId period,
                                            const std::string& ageGroup,
                                            const Date& date,
                                            const TimeOfDay& time,
                                            const std::optional<std::string>& room) {
    const std::vector<OpenShift> shifts = m_source.openShifts(period, date);
    const std::vector<DutyAssignment> schedule = m_source.dutySchedule(period, date);

    std::unordered_set<PersonId> working;
    for (const auto& shift : shifts) {
        if (!shift.onBreak) {
            working.insert(shift.personId);
        }
    }

    std::unordered_set<PersonId> counted;
    for (const auto& duty : schedule) {
        if (!working.count(duty.personId) || !duty.covers(time)) {
            continue;
        }
        if (!duty.ageGroup || *duty.ageGroup != ageGroup) {
            continue;
        }
        if (room && (!duty.room || *duty.room != *room)) {
            continue;
        }
        counted.insert(duty.personId);
    }
    return static_cast<int>(counted.size());
}

int PresenceCounters::childCountForAgeGroup(SchoolPeriodId period,
                                            const std::string& ageGroup,
                                            const Date& date,
                                            const TimeOfDay& /*time*/,
                                            const std::optional<std::string>& /*room*/) {
    const auto entry = m_policy.lookup(ageGroup);
    if (!entry) {
        throw UnknownAgeGroup(ageGroup);
    }

    const std::vector<OpenCheckIn> checkIns = m_source.openCheckIns(period, date);
    std::unordered_set<PersonId> counted;
    for (const auto& child : checkIns) {
        if (!child.dob) {
            continue;
        }
        if (entry->coversAgeInMonths(child.dob->monthsUntil(date))) {
            counted.insert(child.personId);
        }
    }
    return static_cast<int>(counted.size());
}

std::vector<RoomAssignment> PresenceCounters::scheduledRooms(SchoolPeriodId period,
                                                             const Date& date,
                                                             const TimeOfDay& time) {
    std::set<std::pair<std::string, std::string>> pairs;
    for (const auto& duty : m_source.dutySchedule(period, date)) {
        if (duty.covers(time) && duty.room && duty.ageGroup) {
            pairs.emplace(*duty.room, *duty.ageGroup);
        }
    }

    std::vector<RoomAssignment> rooms;
    rooms.reserve(pairs.size());
    for (const auto& [room, ageGroup] : pairs) {
        rooms.push_back(RoomAssignment{room, ageGroup});
    }
    return rooms;
}

}  // namespace compliance
