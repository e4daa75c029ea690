/**
 * Warden Violations
 *
 * Violation taxonomy (machine-readable codes, namespaced types, severities)
 * and the event record shared by the capability layer and the supervisor.
 */
#pragma once
#include <string>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace warden::audit {

enum class Severity {
    LOW,
    MEDIUM,
    HIGH
};

enum class ViolationCode {
    DYNAMIC_CODE,         // Blocked runtime code evaluation
    FS_DENIED,            // Path outside allowlist
    FS_TRAVERSAL,         // Traversal sequence escaping allowlist
    NET_DENIED,           // Host not allowlisted
    MEMORY_SOFT_LIMIT,    // Cumulative allocation exceeded cap
    TIMEOUT,              // Wall-clock budget exceeded
    SERIALIZE_ERROR,      // Return value unsafe to transfer
    VIOLATION_THRESHOLD   // Violation count reached configured cap
};

const char* severity_to_string(Severity severity);
Severity severity_from_string(const std::string& str);

const char* violation_code_to_string(ViolationCode code);
std::optional<ViolationCode> violation_code_from_string(const std::string& str);

// Namespaced type used for category filtering, e.g. "sandbox.fs.denied"
const char* violation_type_for(ViolationCode code);

Severity default_severity(ViolationCode code);

struct ViolationEvent {
    std::string type;                       // Namespaced category
    Severity severity = Severity::MEDIUM;
    std::string message;                    // Human-readable
    std::optional<nlohmann::json> metadata; // Event-specific details (object)
    std::optional<ViolationCode> code;

    // Build an event with the code's default type and severity
    static ViolationEvent make(ViolationCode code, const std::string& message,
                               std::optional<nlohmann::json> metadata = std::nullopt);

    // Convert to JSON
    nlohmann::json to_json() const;

    // Parse from JSON (inverse of to_json)
    static ViolationEvent from_json(const nlohmann::json& j);
};

// Audit callback: invoked once per violation, in emission order
using AuditCallback = std::function<void(const ViolationEvent&)>;

} // namespace warden::audit
