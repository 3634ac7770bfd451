// File: Presence.hpp
// Description: Declares the attendance/staffing source abstraction and the
//              presence counters that turn its raw records into the staff and
//              child headcounts used by the ratio calculator.

#pragma once

#include "compliance/Calendar.hpp"
#include "compliance/RatioPolicy.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace compliance {

using SchoolPeriodId = std::uint32_t;
using PersonId = std::uint32_t;

// Child checked in and not yet checked out.
struct OpenCheckIn {
    PersonId personId{0};
    std::string checkInTime;
    std::optional<Date> dob;
};

// Staff member clocked in, not clocked out, time entry still active.
struct OpenShift {
    PersonId personId{0};
    bool onBreak{false};
};

// One scheduled duty block for a staff member on a given date.
struct DutyAssignment {
    PersonId personId{0};
    std::optional<std::string> ageGroup;
    std::optional<std::string> room;
    TimeOfDay startTime;
    TimeOfDay endTime;
    bool cancelled{false};

    bool covers(const TimeOfDay& time) const {
        return !cancelled && startTime <= time && time <= endTime;
    }
};

struct RoomAssignment {
    std::string room;
    std::string ageGroup;
};

// Read-only view over the host application's attendance and staffing records.
// Implementations throw DataUnavailable when the records cannot be read.
class PresenceSource {
public:
    virtual ~PresenceSource() = default;

    virtual std::vector<OpenCheckIn> openCheckIns(SchoolPeriodId period, const Date& date) = 0;
    virtual std::vector<OpenShift> openShifts(SchoolPeriodId period, const Date& date) = 0;
    virtual std::vector<DutyAssignment> dutySchedule(SchoolPeriodId period, const Date& date) = 0;
};

class PresenceCounters {
public:
    // Children carry no room attribution, so a room-scoped child count is the
    // age-group-wide count.
    static constexpr bool kRoomChildCountingSupported = false;

    PresenceCounters(PresenceSource& source, const RatioPolicy& policy);

    int staffCountForAgeGroup(SchoolPeriodId period,
                              const std::string& ageGroup,
                              const Date& date,
                              const TimeOfDay& time,
                              const std::optional<std::string>& room = std::nullopt);

    // Throws UnknownAgeGroup when the age group has no configured age band.
    int childCountForAgeGroup(SchoolPeriodId period,
                              const std::string& ageGroup,
                              const Date& date,
                              const TimeOfDay& time,
                              const std::optional<std::string>& room = std::nullopt);

    // Distinct (room, age group) pairs with a live duty assignment, by room.
    std::vector<RoomAssignment> scheduledRooms(SchoolPeriodId period,
                                               const Date& date,
                                               const TimeOfDay& time);

    bool roomChildCountingSupported() const noexcept { return kRoomChildCountingSupported; }

private:
    PresenceSource& m_source;
    RatioPolicy m_policy;
};

}  // namespace compliance
