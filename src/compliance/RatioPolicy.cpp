// File: RatioPolicy.cpp
// Description: Implements construction, parsing and lookup of ratio policies.

#include "compliance/RatioPolicy.hpp"

#include "compliance/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace compliance {

namespace {

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

int parseNonNegative(const std::string& token, const std::string& context) {
    const std::string text = trim(token);
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(),
                     [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; })) {
        throw InvalidParameters("Invalid number '" + token + "' in ratio policy entry '" +
                                context + "'.");
    }
    try {
        return std::stoi(text);
    } catch (const std::out_of_range&) {
        throw InvalidParameters("Number out of range in ratio policy entry '" + context + "'.");
    }
}

}  // namespace

RatioPolicy::RatioPolicy(std::vector<RatioPolicyEntry> entries)
    : m_entries(std::move(entries)) {
    if (m_entries.empty()) {
        throw InvalidParameters("Ratio policy must define at least one age group.");
    }
    std::unordered_set<std::string> seen;
    for (const auto& entry : m_entries) {
        if (entry.ageGroup.empty()) {
            throw InvalidParameters("Ratio policy entry has an empty age group label.");
        }
        if (!seen.insert(entry.ageGroup).second) {
            throw InvalidParameters("Duplicate age group '" + entry.ageGroup + "' in ratio policy.");
        }
        if (entry.maxChildrenPerStaff <= 0) {
            throw InvalidParameters("Age group '" + entry.ageGroup +
                                    "' must allow at least one child per staff member.");
        }
        if (entry.minMonths < 0 || (entry.maxMonths && *entry.maxMonths <= entry.minMonths)) {
            throw InvalidParameters("Age group '" + entry.ageGroup + "' has an empty age band.");
        }
    }
}

RatioPolicy RatioPolicy::quebecDefaults() {
    return RatioPolicy({
        RatioPolicyEntry{"Infant", 5, 0, 18},
        RatioPolicyEntry{"Toddler", 8, 18, 36},
        RatioPolicyEntry{"Preschool", 10, 36, 60},
        RatioPolicyEntry{"School Age", 20, 60, std::nullopt},
    });
}

RatioPolicy RatioPolicy::parse(const std::string& text) {
    std::vector<RatioPolicyEntry> entries;
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t semi = text.find(';', start);
        const std::string raw =
            text.substr(start, semi == std::string::npos ? std::string::npos : semi - start);
        const std::string item = trim(raw);
        if (!item.empty()) {
            const std::size_t eq = item.find('=');
            const std::size_t at = item.find('@', eq == std::string::npos ? 0 : eq);
            const std::size_t dash = item.find('-', at == std::string::npos ? 0 : at);
            if (eq == std::string::npos || at == std::string::npos || dash == std::string::npos) {
                throw InvalidParameters("Malformed ratio policy entry '" + item +
                                        "' (expected Label=ratio@min-max).");
            }
            RatioPolicyEntry entry;
            entry.ageGroup = trim(item.substr(0, eq));
            entry.maxChildrenPerStaff = parseNonNegative(item.substr(eq + 1, at - eq - 1), item);
            entry.minMonths = parseNonNegative(item.substr(at + 1, dash - at - 1), item);
            const std::string maxText = trim(item.substr(dash + 1));
            if (!maxText.empty()) {
                entry.maxMonths = parseNonNegative(maxText, item);
            }
            entries.push_back(std::move(entry));
        }
        if (semi == std::string::npos) {
            break;
        }
        start = semi + 1;
    }
    return RatioPolicy(std::move(entries));
}

std::optional<RatioPolicyEntry> RatioPolicy::lookup(const std::string& ageGroup) const {
    const auto it = std::find_if(m_entries.begin(), m_entries.end(),
                                 [&](const RatioPolicyEntry& e) { return e.ageGroup == ageGroup; });
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<std::string> RatioPolicy::ageGroups() const {
    std::vector<std::string> labels;
    labels.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        labels.push_back(entry.ageGroup);
    }
    return labels;
}

}  // namespace compliance
