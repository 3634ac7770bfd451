// File: SnapshotRows.hpp
// Description: Maps snapshot table rows (text protocol, NULL-aware) to and
//              from RatioSnapshot values, independent of the MySQL client.

#pragma once

#include "compliance/SnapshotRepository.hpp"

#include <optional>
#include <string>
#include <vector>

namespace compliance {

// One result row; std::nullopt is SQL NULL.
using MySqlRow = std::vector<std::optional<std::string>>;

// Finite ratios are capped just below this value; the unbounded ratio is
// written as the value itself.
constexpr double kUnboundedRatioStorageValue = 999.99;

// Column order of snapshotColumns(), shared by SELECT and snapshotFromRow.
const char* snapshotColumns();

const std::string& requiredColumn(const MySqlRow& row, std::size_t index);
long long columnToInteger(const std::string& value);
double columnToDecimal(const std::string& value);
std::string formatDecimal(double value);  // two decimal places

double storedRatioValue(const ActualRatio& ratio);

// A row reads back as unbounded exactly when it has children and no staff.
RatioSnapshot snapshotFromRow(const MySqlRow& row);

// Throws DuplicateSnapshot for a unique-key conflict, StorageFailure otherwise.
[[noreturn]] void throwInsertFailure(const RatioSnapshot& snapshot,
                                     bool duplicateKey,
                                     unsigned int err,
                                     const std::string& message);

}  // namespace compliance
