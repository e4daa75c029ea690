/**
 * Warden Violation Recorder
 *
 * The single emission path for a run's violations. Appends in emission
 * order, forwards to the audit callback, and owns the violation-threshold
 * trip so that VIOLATION_THRESHOLD is recorded at most once per run.
 */
#pragma once
#include <vector>
#include <optional>
#include <cstdint>
#include "audit/violation.hpp"

namespace warden::audit {

class ViolationRecorder {
public:
    ViolationRecorder() = default;
    ViolationRecorder(std::optional<uint32_t> max_violations, AuditCallback callback);

    // Record a violation. Returns true if the threshold has been reached.
    bool emit(const ViolationEvent& event);

    // True once a configured threshold has been reached
    bool threshold_reached() const;

    // Append the VIOLATION_THRESHOLD event unless it already exists.
    // Returns true if this call appended it.
    bool emit_threshold_once();

    bool has_high_severity() const;
    std::optional<ViolationEvent> first_high_severity() const;

    const std::vector<ViolationEvent>& events() const { return events_; }
    size_t count() const { return events_.size(); }

private:
    std::optional<uint32_t> max_violations_;
    AuditCallback callback_;
    std::vector<ViolationEvent> events_;
    bool threshold_emitted_ = false;

    void append(const ViolationEvent& event);
};

} // namespace warden::audit
