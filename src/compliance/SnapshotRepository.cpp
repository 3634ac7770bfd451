// File: SnapshotRepository.cpp
// Description: Implements snapshot filtering and the in-process repository.

#include "compliance/SnapshotRepository.hpp"

#include "compliance/Errors.hpp"

#include <algorithm>
#include <set>

namespace compliance {

bool SnapshotFilter::matches(const RatioSnapshot& snapshot) const {
    if (period && snapshot.period != *period) {
        return false;
    }
    if (date && snapshot.snapshotDate != *date) {
        return false;
    }
    if (dateFrom && snapshot.snapshotDate < *dateFrom) {
        return false;
    }
    if (dateTo && snapshot.snapshotDate > *dateTo) {
        return false;
    }
    if (ageGroup && snapshot.ageGroup != *ageGroup) {
        return false;
    }
    if (room && snapshot.room != room) {
        return false;
    }
    if (isCompliant && snapshot.isCompliant != *isCompliant) {
        return false;
    }
    if (alertSent && snapshot.alertSent != *alertSent) {
        return false;
    }
    if (isAutomatic && snapshot.isAutomatic != *isAutomatic) {
        return false;
    }
    return true;
}

bool newerFirst(const RatioSnapshot& a, const RatioSnapshot& b) {
    if (a.snapshotDate != b.snapshotDate) {
        return a.snapshotDate > b.snapshotDate;
    }
    if (a.snapshotTime != b.snapshotTime) {
        return a.snapshotTime > b.snapshotTime;
    }
    return a.id > b.id;
}

std::string describeKey(const RatioSnapshot& snapshot) {
    return snapshot.ageGroup + " / " + snapshot.room.value_or("all rooms") + " at " +
           snapshot.snapshotDate.toString() + " " + snapshot.snapshotTime.toString() +
           " (period " + std::to_string(snapshot.period) + ")";
}

InMemorySnapshotRepository::Key InMemorySnapshotRepository::keyOf(const RatioSnapshot& snapshot) {
    return Key{snapshot.period, snapshot.ageGroup, snapshot.room,
               snapshot.snapshotDate.toDays(), snapshot.snapshotTime.secondsSinceMidnight()};
}

SnapshotId InMemorySnapshotRepository::insert(const RatioSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Key key = keyOf(snapshot);
    if (m_uniqueIndex.count(key) != 0) {
        throw DuplicateSnapshot("Snapshot already recorded for " + describeKey(snapshot) + ".");
    }
    const SnapshotId id = m_nextId++;
    RatioSnapshot row = snapshot;
    row.id = id;
    m_rows.emplace(id, std::move(row));
    m_uniqueIndex.emplace(key, id);
    return id;
}

std::optional<RatioSnapshot> InMemorySnapshotRepository::findById(SnapshotId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_rows.find(id);
    if (it == m_rows.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RatioSnapshot> InMemorySnapshotRepository::query(const SnapshotFilter& filter) {
    std::vector<RatioSnapshot> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_rows) {
            if (filter.matches(entry.second)) {
                result.push_back(entry.second);
            }
        }
    }
    std::sort(result.begin(), result.end(), newerFirst);
    return result;
}

bool InMemorySnapshotRepository::markAlertSent(SnapshotId id, const std::string& sentAt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_rows.find(id);
    if (it == m_rows.end()) {
        return false;
    }
    if (!it->second.alertSent) {
        it->second.alertSent = true;
        it->second.alertSentTime = sentAt;
    }
    return true;
}

std::size_t InMemorySnapshotRepository::deleteBefore(const Date& cutoff) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t removed = 0;
    for (auto it = m_rows.begin(); it != m_rows.end();) {
        if (it->second.snapshotDate < cutoff) {
            m_uniqueIndex.erase(keyOf(it->second));
            it = m_rows.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<std::string> InMemorySnapshotRepository::distinctRooms(SchoolPeriodId period) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::set<std::string> rooms;
    for (const auto& entry : m_rows) {
        if (entry.second.period == period && entry.second.room) {
            rooms.insert(*entry.second.room);
        }
    }
    return std::vector<std::string>(rooms.begin(), rooms.end());
}

std::size_t InMemorySnapshotRepository::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rows.size();
}

}  // namespace compliance
