/**
 * Warden Audit Log
 *
 * Append-only in-memory record of violation events across runs and
 * sandboxes. Attach it to a sandbox through as_callback(); entries can be
 * filtered by namespaced type prefix or violation code and exported as JSONL.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "audit/violation.hpp"

namespace warden::audit {

// Audit log entry
struct AuditLogEntry {
    uint64_t id;                              // Unique entry ID
    std::chrono::system_clock::time_point timestamp;
    std::string source;                       // Sandbox / run label
    ViolationEvent event;

    // Convert to JSON
    nlohmann::json to_json() const;

    // Convert to JSONL (single line)
    std::string to_jsonl() const;
};

// Audit logger configuration
struct AuditConfig {
    size_t max_entries = 10000;               // Max entries in memory
    Severity min_severity = Severity::LOW;    // Drop events below this
};

class AuditLogger {
public:
    AuditLogger();
    explicit AuditLogger(const AuditConfig& config);
    ~AuditLogger() = default;

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    // Record a violation
    void record(const std::string& source, const ViolationEvent& event);

    // Audit callback bound to this logger. The logger must outlive its users.
    AuditCallback as_callback(const std::string& source);

    // Query methods (chronological order, newest `limit` entries)
    std::vector<AuditLogEntry> get_entries(
        const std::string& type_prefix = "",   // e.g. "sandbox.fs" (empty = all)
        uint64_t since_id = 0,                 // Get entries after this ID
        size_t limit = 100                     // Max entries to return
    ) const;

    std::vector<AuditLogEntry> get_entries_by_code(ViolationCode code, size_t limit = 100) const;

    // Export to JSONL format
    std::string export_jsonl(size_t limit = 0) const;  // 0 = all entries

    // Configuration
    void set_config(const AuditConfig& config);
    AuditConfig get_config() const;

    // Clear all entries
    void clear();

    // Get statistics
    size_t entry_count() const;
    uint64_t last_entry_id() const;

private:
    AuditConfig config_;
    std::deque<AuditLogEntry> entries_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;

    // Trim entries to max size
    void trim_entries();
};

} // namespace warden::audit
