/**
 * @file ValidationReport.hpp
 * @brief Outcome of a pre-submission document check.
 */

#pragma once
#include <string>

namespace submitkit::domain {

enum class ValidationStatus {
    Ready,
    Risky,
    Invalid
};

inline std::string ValidationStatusToString(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Ready: return "READY";
        case ValidationStatus::Risky: return "RISKY";
        case ValidationStatus::Invalid: return "INVALID";
    }
    return "INVALID";
}

/**
 * @struct ValidationReport
 * @brief Derived once per request, never stored.
 */
struct ValidationReport {
    ValidationStatus status = ValidationStatus::Invalid;
    int pageCount = 0;
    long long size = 0;
    std::string message; ///< Set for INVALID reports only.
};

} // namespace submitkit::domain
