/**
 * conhal Error Reporting
 *
 * Recoverable conditions travel as Result values. Contract violations
 * (an equivalence failure caught by the harness, a broken kernel self-test)
 * are exceptions derived from std::runtime_error.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace conhal {

/**
 * Error codes shared by detection, selection, config and verification.
 */
enum class ErrorCode {
    Success = 0,
    DetectionUncertain,     // Probe could not determine a capability
    UnsupportedOperation,   // Operation has no implementation (caught at build time)
    EquivalenceViolation,   // Backend output differs from the reference
    DegradedAcceleration,   // Feature advertised but not usable, fell back one rung
    InvalidInput,
    ConfigError
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:              return "Success";
        case ErrorCode::DetectionUncertain:   return "DetectionUncertain";
        case ErrorCode::UnsupportedOperation: return "UnsupportedOperation";
        case ErrorCode::EquivalenceViolation: return "EquivalenceViolation";
        case ErrorCode::DegradedAcceleration: return "DegradedAcceleration";
        case ErrorCode::InvalidInput:         return "InvalidInput";
        case ErrorCode::ConfigError:          return "ConfigError";
    }
    return "Unknown";
}

/**
 * Result wrapper
 */
struct Result {
    ErrorCode code = ErrorCode::Success;
    std::string message;

    bool ok() const { return code == ErrorCode::Success; }
    operator bool() const { return ok(); }

    static Result success() { return {}; }
    static Result error(ErrorCode c, std::string msg) { return {c, std::move(msg)}; }
};

/**
 * Thrown by require_equivalence() when any backend diverged from Generic.
 */
class EquivalenceViolation : public std::runtime_error {
public:
    explicit EquivalenceViolation(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * Thrown when a backend kernel fails its construction-time self-test.
 */
class BackendUnavailable : public std::runtime_error {
public:
    explicit BackendUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};

}  // namespace conhal
