// File: SnapshotRepository.hpp
// Description: Declares the durable ratio snapshot record and the storage
//              abstraction behind the snapshot store, plus an in-process
//              implementation.

#pragma once

#include "compliance/Calendar.hpp"
#include "compliance/Presence.hpp"
#include "compliance/RatioCalculator.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace compliance {

using SnapshotId = std::uint64_t;

struct RatioSnapshot {
    SnapshotId id{0};
    SchoolPeriodId period{0};
    Date snapshotDate;
    TimeOfDay snapshotTime;
    std::string ageGroup;
    std::optional<std::string> room;  // empty: aggregated across rooms
    int staffCount{0};
    int childCount{0};
    int requiredRatio{0};
    ActualRatio actualRatio{ActualRatio::finite(0.0)};
    bool isCompliant{true};
    double compliancePercent{0.0};
    bool alertSent{false};
    std::optional<std::string> alertSentTime;
    std::optional<std::string> notes;
    bool isAutomatic{true};
    std::optional<PersonId> recordedBy;
};

struct SnapshotFilter {
    std::optional<SchoolPeriodId> period;
    std::optional<Date> date;
    std::optional<Date> dateFrom;
    std::optional<Date> dateTo;
    std::optional<std::string> ageGroup;
    std::optional<std::string> room;
    std::optional<bool> isCompliant;
    std::optional<bool> alertSent;
    std::optional<bool> isAutomatic;

    bool matches(const RatioSnapshot& snapshot) const;
};

// Storage for ratio snapshots. insert() must enforce uniqueness of
// (period, age group, room, date, time) atomically and throw
// DuplicateSnapshot on conflict.
class SnapshotRepository {
public:
    virtual ~SnapshotRepository() = default;

    virtual SnapshotId insert(const RatioSnapshot& snapshot) = 0;
    virtual std::optional<RatioSnapshot> findById(SnapshotId id) = 0;
    // Ordered newest first (date desc, time desc, id desc).
    virtual std::vector<RatioSnapshot> query(const SnapshotFilter& filter) = 0;
    // Sets alertSent and stamps the time unless already set. Returns false
    // when no snapshot has that id.
    virtual bool markAlertSent(SnapshotId id, const std::string& sentAt) = 0;
    // Removes snapshots dated strictly before cutoff; returns rows removed.
    virtual std::size_t deleteBefore(const Date& cutoff) = 0;
    virtual std::vector<std::string> distinctRooms(SchoolPeriodId period) = 0;
};

class InMemorySnapshotRepository : public SnapshotRepository {
public:
    SnapshotId insert(const RatioSnapshot& snapshot) override;
    std::optional<RatioSnapshot> findById(SnapshotId id) override;
    std::vector<RatioSnapshot> query(const SnapshotFilter& filter) override;
    bool markAlertSent(SnapshotId id, const std::string& sentAt) override;
    std::size_t deleteBefore(const Date& cutoff) override;
    std::vector<std::string> distinctRooms(SchoolPeriodId period) override;

    std::size_t size() const;

private:
    using Key = std::tuple<SchoolPeriodId, std::string, std::optional<std::string>, long long, int>;
    static Key keyOf(const RatioSnapshot& snapshot);

    mutable std::mutex m_mutex;
    std::map<SnapshotId, RatioSnapshot> m_rows;
    std::map<Key, SnapshotId> m_uniqueIndex;
    SnapshotId m_nextId{1};
};

// Orders newest first; shared by repository implementations and reports.
bool newerFirst(const RatioSnapshot& a, const RatioSnapshot& b);

std::string describeKey(const RatioSnapshot& snapshot);

}  // namespace compliance
