/**
 * Warden Run Result
 *
 * Verdict of one sandboxed run, assembled by the supervisor once the run
 * has ended. Callers inspect `success` and `violations`; run() never
 * reports failure by throwing.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>
#include "audit/violation.hpp"
#include "runtime/value.hpp"

namespace warden::runtime {

enum class RunErrorKind {
    DISPOSED,             // run() on a disposed sandbox, or disposed mid-run
    BUSY,                 // Another run is in progress
    SPAWN_FAILED,         // Execution context could not be created
    TIMEOUT,
    VIOLATION_THRESHOLD,
    RUNTIME_ERROR,        // Uncaught exception in submitted code
    SERIALIZATION,        // Return value not transferable
    POLICY_VIOLATION      // High-severity violation on an otherwise clean run
};

const char* run_error_kind_to_string(RunErrorKind kind);

struct RunError {
    RunErrorKind kind;
    std::string message;
};

struct RunResult {
    bool success = false;
    std::optional<RunError> error;
    std::vector<audit::ViolationEvent> violations;
    std::chrono::microseconds duration{0};
    std::optional<Value> return_value;          // Only when success

    size_t count(audit::ViolationCode code) const;
    bool has_violation(audit::ViolationCode code) const { return count(code) > 0; }

    // Convert to JSON
    nlohmann::json to_json() const;
};

} // namespace warden::runtime
