// File: Errors.hpp
// Description: Declares the exception types raised by the ratio compliance
//              library. Every error carries an ErrorKind so batch callers can
//              report failures per entry without string matching.

#pragma once

#include <stdexcept>
#include <string>

namespace compliance {

enum class ErrorKind {
    DataUnavailable,
    UnknownAgeGroup,
    DuplicateSnapshot,
    InvalidParameters,
    StorageFailure
};

std::string toString(ErrorKind kind);

class ComplianceError : public std::runtime_error {
public:
    ComplianceError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

// Presence source could not be read. Never reported as a zero count.
class DataUnavailable : public ComplianceError {
public:
    explicit DataUnavailable(const std::string& message);
};

// Age group label has no entry in the configured ratio policy.
class UnknownAgeGroup : public ComplianceError {
public:
    explicit UnknownAgeGroup(const std::string& ageGroup);

    const std::string& ageGroup() const noexcept { return m_ageGroup; }

private:
    std::string m_ageGroup;
};

// A snapshot already exists for (period, age group, room, date, time).
class DuplicateSnapshot : public ComplianceError {
public:
    explicit DuplicateSnapshot(const std::string& message);
};

class InvalidParameters : public ComplianceError {
public:
    explicit InvalidParameters(const std::string& message);
};

// Snapshot storage rejected a statement for a reason other than uniqueness.
class StorageFailure : public ComplianceError {
public:
    explicit StorageFailure(const std::string& message);
};

}  // namespace compliance
