// File: RatioMonitor.hpp
// Description: Declares live (unpersisted) ratio evaluation: presence counts
//              fed through the calculator for an age group, every configured
//              age group, or every scheduled room.

#pragma once

#include "compliance/Presence.hpp"
#include "compliance/RatioCalculator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace compliance {

struct StaffingShortfall {
    int totalStaffNeeded{0};
    bool overallCompliant{true};
    std::vector<RatioEvaluation> details;
    std::string calculatedAt;
};

class RatioMonitor {
public:
    RatioMonitor(PresenceCounters& counters, const RatioCalculator& calculator);

    RatioEvaluation currentRatio(SchoolPeriodId period,
                                 const std::string& ageGroup,
                                 const Date& date,
                                 const TimeOfDay& time,
                                 const std::optional<std::string>& room = std::nullopt);

    // One evaluation per configured age group, in policy order.
    std::vector<RatioEvaluation> currentRatios(SchoolPeriodId period,
                                               const Date& date,
                                               const TimeOfDay& time);

    // One evaluation per scheduled (room, age group) pair, ordered by room.
    std::vector<RatioEvaluation> currentRatiosByRoom(SchoolPeriodId period,
                                                     const Date& date,
                                                     const TimeOfDay& time);

    StaffingShortfall staffingShortfall(SchoolPeriodId period,
                                        const Date& date,
                                        const TimeOfDay& time);

    PresenceCounters& counters() noexcept { return m_counters; }
    const RatioCalculator& calculator() const noexcept { return m_calculator; }

private:
    PresenceCounters& m_counters;
    const RatioCalculator& m_calculator;
};

}  // namespace compliance
