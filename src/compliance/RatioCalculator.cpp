// File: RatioCalculator.cpp
// Description: Implements the staff-to-child ratio verdict.

#include "compliance/RatioCalculator.hpp"

#include "compliance/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace compliance {

double ActualRatio::value() const {
    if (m_unbounded) {
        throw std::logic_error("Unbounded ratio has no finite value.");
    }
    return m_value;
}

std::string ActualRatio::toString() const {
    if (m_unbounded) {
        return "unbounded";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", m_value);
    return std::string(buffer);
}

double roundToCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

RatioCalculator::RatioCalculator(const RatioPolicy& policy) : m_policy(policy) {}

RatioEvaluation RatioCalculator::evaluate(const std::string& ageGroup,
                                          int staffCount,
                                          int childCount) const {
    const auto entry = m_policy.lookup(ageGroup);
    if (!entry) {
        throw UnknownAgeGroup(ageGroup);
    }
    if (staffCount < 0 || childCount < 0) {
        throw InvalidParameters("Presence counts must be non-negative.");
    }

    const int required = entry->maxChildrenPerStaff;
    const long long capacity = static_cast<long long>(staffCount) * required;

    RatioEvaluation result;
    result.ageGroup = ageGroup;
    result.staffCount = staffCount;
    result.childCount = childCount;
    result.requiredRatio = required;

    if (staffCount > 0) {
        result.actualRatio = ActualRatio::finite(
            roundToCents(static_cast<double>(childCount) / static_cast<double>(staffCount)));
    } else if (childCount > 0) {
        result.actualRatio = ActualRatio::unbounded();
    } else {
        result.actualRatio = ActualRatio::finite(0.0);
    }

    // Compared on exact counts so that rounding the displayed ratio can never
    // turn c > s*r into a compliant verdict.
    result.isCompliant = (staffCount == 0 && childCount == 0) ||
                         (staffCount > 0 && childCount <= capacity);

    if (staffCount > 0 && childCount > 0) {
        result.compliancePercent =
            roundToCents(static_cast<double>(childCount) / static_cast<double>(capacity) * 100.0);
    }

    if (!result.isCompliant) {
        const int minimumStaff = (childCount + required - 1) / required;
        result.staffNeeded = std::max(0, minimumStaff - staffCount);
    }

    if (result.isCompliant && staffCount > 0) {
        result.additionalCapacity = static_cast<int>(std::max(0LL, capacity - childCount));
    }

    return result;
}

}  // namespace compliance
