// File: RatioPolicy.hpp
// Description: Declares the regulatory staff-to-child ratio table. A policy is
//              built once at startup and handed by const reference to every
//              component that needs it.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace compliance {

struct RatioPolicyEntry {
    std::string ageGroup;
    int maxChildrenPerStaff{0};
    int minMonths{0};
    std::optional<int> maxMonths;  // exclusive; empty means no upper bound

    bool coversAgeInMonths(int months) const {
        return months >= minMonths && (!maxMonths || months < *maxMonths);
    }
};

class RatioPolicy {
public:
    // Throws InvalidParameters on duplicate labels, non-positive ratios or
    // empty age bands.
    explicit RatioPolicy(std::vector<RatioPolicyEntry> entries);

    // Quebec regulation: Infant 1:5, Toddler 1:8, Preschool 1:10, School Age 1:20.
    static RatioPolicy quebecDefaults();

    // Format: "Label=ratio@min-max;Label=ratio@min-" (whitespace around tokens
    // is ignored). Throws InvalidParameters when malformed.
    static RatioPolicy parse(const std::string& text);

    std::optional<RatioPolicyEntry> lookup(const std::string& ageGroup) const;

    // Labels in configuration order.
    std::vector<std::string> ageGroups() const;
    const std::vector<RatioPolicyEntry>& entries() const noexcept { return m_entries; }

private:
    std::vector<RatioPolicyEntry> m_entries;
};

}  // namespace compliance
