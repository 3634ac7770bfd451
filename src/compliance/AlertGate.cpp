// File: AlertGate.cpp
// Description: Implements alert and warning selection over stored snapshots.

#include "compliance/AlertGate.hpp"

#include "compliance/Errors.hpp"

#include <utility>

namespace compliance {

AlertGate::AlertGate(SnapshotStore& store) : m_store(store) {}

std::vector<RatioSnapshot> AlertGate::snapshotsNeedingAlert(SchoolPeriodId period,
                                                            const Date& date) {
    SnapshotFilter filter;
    filter.period = period;
    filter.date = date;
    filter.isCompliant = false;
    filter.alertSent = false;
    return m_store.query(filter);
}

std::vector<RatioSnapshot> AlertGate::snapshotsAtWarningLevel(SchoolPeriodId period,
                                                              const Date& date,
                                                              double thresholdPercent) {
    if (thresholdPercent < 0.0) {
        throw InvalidParameters("Warning threshold must not be negative.");
    }
    SnapshotFilter filter;
    filter.period = period;
    filter.date = date;
    filter.isCompliant = true;

    std::vector<RatioSnapshot> result;
    for (auto& snapshot : m_store.query(filter)) {
        if (snapshot.compliancePercent >= thresholdPercent) {
            result.push_back(std::move(snapshot));
        }
    }
    return result;
}

bool AlertGate::acknowledge(SnapshotId id) {
    return m_store.markAlertSent(id);
}

}  // namespace compliance
