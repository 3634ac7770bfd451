// File: RatioCalculator.hpp
// Description: Declares the pure compliance verdict computed from a ratio
//              policy entry and a pair of presence counts.

#pragma once

#include "compliance/RatioPolicy.hpp"

#include <optional>
#include <string>

namespace compliance {

// Children per staff member. Unbounded when children are present with no staff.
class ActualRatio {
public:
    static ActualRatio finite(double value) { return ActualRatio(false, value); }
    static ActualRatio unbounded() { return ActualRatio(true, 0.0); }

    bool isUnbounded() const noexcept { return m_unbounded; }
    // Throws std::logic_error for an unbounded ratio.
    double value() const;

    std::string toString() const;  // "7.50" or "unbounded"

    friend bool operator==(const ActualRatio& a, const ActualRatio& b) {
        return a.m_unbounded == b.m_unbounded && (a.m_unbounded || a.m_value == b.m_value);
    }
    friend bool operator!=(const ActualRatio& a, const ActualRatio& b) { return !(a == b); }

private:
    ActualRatio(bool unbounded, double value) : m_unbounded(unbounded), m_value(value) {}

    bool m_unbounded;
    double m_value;
};

struct RatioEvaluation {
    std::string ageGroup;
    std::optional<std::string> room;
    int staffCount{0};
    int childCount{0};
    int requiredRatio{0};
    ActualRatio actualRatio{ActualRatio::finite(0.0)};
    bool isCompliant{true};
    double compliancePercent{0.0};
    int staffNeeded{0};
    int additionalCapacity{0};
    std::string calculatedAt;  // "YYYY-MM-DD HH:MM:SS", empty when evaluated off-clock
};

// Round half away from zero to two decimal places.
double roundToCents(double value);

class RatioCalculator {
public:
    // Keeps its own copy of the policy.
    explicit RatioCalculator(const RatioPolicy& policy);

    // Throws UnknownAgeGroup when the policy has no entry for ageGroup and
    // InvalidParameters for negative counts. Performs no I/O.
    RatioEvaluation evaluate(const std::string& ageGroup, int staffCount, int childCount) const;

    const RatioPolicy& policy() const noexcept { return m_policy; }

private:
    RatioPolicy m_policy;
};

}  // namespace compliance
