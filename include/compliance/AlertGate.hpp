// File: AlertGate.hpp
// Description: Declares the selection queries a notification dispatcher uses
//              to find breached and near-breach snapshots. Delivery happens
//              elsewhere; the dispatcher acknowledges through acknowledge().

#pragma once

#include "compliance/SnapshotStore.hpp"

#include <vector>

namespace compliance {

class AlertGate {
public:
    static constexpr double kDefaultWarningThreshold = 90.0;

    explicit AlertGate(SnapshotStore& store);

    // Non-compliant snapshots on date with no alert sent yet, newest first.
    std::vector<RatioSnapshot> snapshotsNeedingAlert(SchoolPeriodId period, const Date& date);

    // Compliant snapshots on date at or above thresholdPercent of capacity,
    // newest first. Throws InvalidParameters for a negative threshold.
    std::vector<RatioSnapshot> snapshotsAtWarningLevel(
        SchoolPeriodId period,
        const Date& date,
        double thresholdPercent = kDefaultWarningThreshold);

    // Forwards to SnapshotStore::markAlertSent.
    bool acknowledge(SnapshotId id);

private:
    SnapshotStore& m_store;
};

}  // namespace compliance
