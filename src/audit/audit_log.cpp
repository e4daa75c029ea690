#include "audit/audit_log.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace warden::audit {

using json = nlohmann::json;

// ============================================================================
// AuditLogEntry Implementation
// ============================================================================

json AuditLogEntry::to_json() const {
    json j;
    j["id"] = id;

    // Format timestamp as ISO 8601
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    j["timestamp"] = oss.str();

    if (!source.empty()) {
        j["source"] = source;
    }
    j["event"] = event.to_json();

    return j;
}

std::string AuditLogEntry::to_jsonl() const {
    // Sandboxed input may carry invalid UTF-8; never let export throw
    return to_json().dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

// ============================================================================
// AuditLogger Implementation
// ============================================================================

AuditLogger::AuditLogger() : config_() {
    spdlog::debug("AuditLogger initialized with default config");
}

AuditLogger::AuditLogger(const AuditConfig& config) : config_(config) {
    spdlog::debug("AuditLogger initialized (max_entries={})", config_.max_entries);
}

void AuditLogger::record(const std::string& source, const ViolationEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (event.severity < config_.min_severity) {
        return;
    }

    AuditLogEntry entry;
    entry.id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.source = source;
    entry.event = event;

    spdlog::trace("Audit[{}]: {} source={}", entry.id, event.type, source);

    entries_.push_back(std::move(entry));
    trim_entries();
}

AuditCallback AuditLogger::as_callback(const std::string& source) {
    return [this, source](const ViolationEvent& event) {
        record(source, event);
    };
}

std::vector<AuditLogEntry> AuditLogger::get_entries(
    const std::string& type_prefix,
    uint64_t since_id,
    size_t limit) const {

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogEntry> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        const auto& entry = *it;

        // Filter by since_id
        if (entry.id <= since_id) {
            continue;
        }

        // Filter by namespaced type ("sandbox.fs" matches "sandbox.fs.denied")
        if (!type_prefix.empty()) {
            const auto& type = entry.event.type;
            bool matches = type == type_prefix ||
                (type.size() > type_prefix.size() &&
                 type.compare(0, type_prefix.size(), type_prefix) == 0 &&
                 type[type_prefix.size()] == '.');
            if (!matches) {
                continue;
            }
        }

        result.push_back(entry);
    }

    // Reverse to get chronological order
    std::reverse(result.begin(), result.end());
    return result;
}

std::vector<AuditLogEntry> AuditLogger::get_entries_by_code(ViolationCode code,
                                                            size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogEntry> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        if (it->event.code == code) {
            result.push_back(*it);
        }
    }

    std::reverse(result.begin(), result.end());
    return result;
}

std::string AuditLogger::export_jsonl(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    size_t count = 0;
    for (const auto& entry : entries_) {
        if (limit > 0 && count >= limit) {
            break;
        }
        oss << entry.to_jsonl();
        count++;
    }

    return oss.str();
}

void AuditLogger::set_config(const AuditConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    trim_entries();
    spdlog::debug("AuditLogger config updated (max_entries={})", config_.max_entries);
}

AuditConfig AuditLogger::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void AuditLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    spdlog::debug("AuditLogger cleared");
}

size_t AuditLogger::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t AuditLogger::last_entry_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

void AuditLogger::trim_entries() {
    // Caller must hold the mutex
    while (entries_.size() > config_.max_entries) {
        entries_.pop_front();
    }
}

} // namespace warden::audit
