// File: Errors.cpp
// Description: Implements the compliance exception hierarchy.

#include "compliance/Errors.hpp"

namespace compliance {

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DataUnavailable:
            return "DataUnavailable";
        case ErrorKind::UnknownAgeGroup:
            return "UnknownAgeGroup";
        case ErrorKind::DuplicateSnapshot:
            return "DuplicateSnapshot";
        case ErrorKind::InvalidParameters:
            return "InvalidParameters";
        case ErrorKind::StorageFailure:
            return "StorageFailure";
    }
    return "StorageFailure";
}

ComplianceError::ComplianceError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), m_kind(kind) {}

DataUnavailable::DataUnavailable(const std::string& message)
    : ComplianceError(ErrorKind::DataUnavailable, message) {}

UnknownAgeGroup::UnknownAgeGroup(const std::string& ageGroup)
    : ComplianceError(ErrorKind::UnknownAgeGroup,
                      "No ratio policy configured for age group '" + ageGroup + "'."),
      m_ageGroup(ageGroup) {}

DuplicateSnapshot::DuplicateSnapshot(const std::string& message)
    : ComplianceError(ErrorKind::DuplicateSnapshot, message) {}

InvalidParameters::InvalidParameters(const std::string& message)
    : ComplianceError(ErrorKind::InvalidParameters, message) {}

StorageFailure::StorageFailure(const std::string& message)
    : ComplianceError(ErrorKind::StorageFailure, message) {}

}  // namespace compliance
