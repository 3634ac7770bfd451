// File: RatioMonitor.cpp
// Description: Implements live ratio evaluation over the presence counters.

#include "compliance/RatioMonitor.hpp"

#include "compliance/Errors.hpp"

namespace compliance {

RatioMonitor::RatioMonitor(PresenceCounters& counters, const RatioCalculator& calculator)
    : m_counters(counters), m_calculator(calculator) {}

RatioEvaluation RatioMonitor::currentRatio(SchoolPeriodId period,
                                           const std::string& ageGroup,
                                           const Date& date,
                                           const TimeOfDay& time,
                                           const std::optional<std::string>& room) {
    if (room && room->empty()) {
        throw InvalidParameters("Room name must not be empty.");
    }
    // Policy gaps surface before any presence query is issued.
    if (!m_calculator.policy().lookup(ageGroup)) {
        throw UnknownAgeGroup(ageGroup);
    }

    const int staff = m_counters.staffCountForAgeGroup(period, ageGroup, date, time, room);
    const int children = m_counters.childCountForAgeGroup(period, ageGroup, date, time, room);

    RatioEvaluation evaluation = m_calculator.evaluate(ageGroup, staff, children);
    evaluation.room = room;
    evaluation.calculatedAt = date.toString() + " " + time.toString();
    return evaluation;
}

std::vector<RatioEvaluation> RatioMonitor::currentRatios(SchoolPeriodId period,
                                                         const Date& date,
                                                         const TimeOfDay& time) {
    std::vector<RatioEvaluation> ratios;
    for (const auto& ageGroup : m_calculator.policy().ageGroups()) {
        ratios.push_back(currentRatio(period, ageGroup, date, time));
    }
    return ratios;
}

std::vector<RatioEvaluation> RatioMonitor::currentRatiosByRoom(SchoolPeriodId period,
                                                               const Date& date,
                                                               const TimeOfDay& time) {
    std::vector<RatioEvaluation> ratios;
    for (const auto& assignment : m_counters.scheduledRooms(period, date, time)) {
        ratios.push_back(currentRatio(period, assignment.ageGroup, date, time, assignment.room));
    }
    return ratios;
}

StaffingShortfall RatioMonitor::staffingShortfall(SchoolPeriodId period,
                                                  const Date& date,
                                                  const TimeOfDay& time) {
    StaffingShortfall shortfall;
    shortfall.details = currentRatios(period, date, time);
    for (const auto& evaluation : shortfall.details) {
        shortfall.totalStaffNeeded += evaluation.staffNeeded;
    }
    shortfall.overallCompliant = shortfall.totalStaffNeeded == 0;
    shortfall.calculatedAt = date.toString() + " " + time.toString();
    return shortfall;
}

}  // namespace compliance
