#include "audit/violation_recorder.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace warden::audit {

ViolationRecorder::ViolationRecorder(std::optional<uint32_t> max_violations,
                                     AuditCallback callback)
    : max_violations_(max_violations)
    , callback_(std::move(callback)) {}

bool ViolationRecorder::emit(const ViolationEvent& event) {
    append(event);

    if (threshold_reached()) {
        emit_threshold_once();
        return true;
    }
    return false;
}

bool ViolationRecorder::threshold_reached() const {
    if (!max_violations_) {
        return false;
    }
    auto counted = std::count_if(events_.begin(), events_.end(), [](const ViolationEvent& e) {
        return e.code != ViolationCode::VIOLATION_THRESHOLD;
    });
    return static_cast<uint64_t>(counted) >= *max_violations_;
}

bool ViolationRecorder::emit_threshold_once() {
    if (threshold_emitted_ || !max_violations_) {
        return false;
    }
    threshold_emitted_ = true;

    nlohmann::json metadata;
    metadata["max_violations"] = *max_violations_;
    metadata["recorded"] = events_.size();
    append(ViolationEvent::make(ViolationCode::VIOLATION_THRESHOLD,
        "Violation threshold reached (" + std::to_string(*max_violations_) + ")",
        metadata));
    return true;
}

bool ViolationRecorder::has_high_severity() const {
    return first_high_severity().has_value();
}

std::optional<ViolationEvent> ViolationRecorder::first_high_severity() const {
    for (const auto& event : events_) {
        if (event.severity == Severity::HIGH) {
            return event;
        }
    }
    return std::nullopt;
}

void ViolationRecorder::append(const ViolationEvent& event) {
    events_.push_back(event);

    spdlog::warn("Violation [{}] {}: {}",
        severity_to_string(event.severity), event.type, event.message);

    if (!callback_) {
        return;
    }
    try {
        callback_(event);
    } catch (const std::exception& e) {
        spdlog::error("Audit callback failed for {}: {}", event.type, e.what());
    }
}

} // namespace warden::audit
