#include "audit/violation.hpp"

namespace warden::audit {

const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::LOW:    return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH:   return "high";
        default: return "unknown";
    }
}

Severity severity_from_string(const std::string& str) {
    if (str == "low")  return Severity::LOW;
    if (str == "high") return Severity::HIGH;
    return Severity::MEDIUM;  // Default
}

const char* violation_code_to_string(ViolationCode code) {
    switch (code) {
        case ViolationCode::DYNAMIC_CODE:        return "DYNAMIC_CODE";
        case ViolationCode::FS_DENIED:           return "FS_DENIED";
        case ViolationCode::FS_TRAVERSAL:        return "FS_TRAVERSAL";
        case ViolationCode::NET_DENIED:          return "NET_DENIED";
        case ViolationCode::MEMORY_SOFT_LIMIT:   return "MEMORY_SOFT_LIMIT";
        case ViolationCode::TIMEOUT:             return "TIMEOUT";
        case ViolationCode::SERIALIZE_ERROR:     return "SERIALIZE_ERROR";
        case ViolationCode::VIOLATION_THRESHOLD: return "VIOLATION_THRESHOLD";
        default: return "UNKNOWN";
    }
}

std::optional<ViolationCode> violation_code_from_string(const std::string& str) {
    if (str == "DYNAMIC_CODE")        return ViolationCode::DYNAMIC_CODE;
    if (str == "FS_DENIED")           return ViolationCode::FS_DENIED;
    if (str == "FS_TRAVERSAL")        return ViolationCode::FS_TRAVERSAL;
    if (str == "NET_DENIED")          return ViolationCode::NET_DENIED;
    if (str == "MEMORY_SOFT_LIMIT")   return ViolationCode::MEMORY_SOFT_LIMIT;
    if (str == "TIMEOUT")             return ViolationCode::TIMEOUT;
    if (str == "SERIALIZE_ERROR")     return ViolationCode::SERIALIZE_ERROR;
    if (str == "VIOLATION_THRESHOLD") return ViolationCode::VIOLATION_THRESHOLD;
    return std::nullopt;
}

const char* violation_type_for(ViolationCode code) {
    switch (code) {
        case ViolationCode::DYNAMIC_CODE:        return "sandbox.dynamic_code";
        case ViolationCode::FS_DENIED:           return "sandbox.fs.denied";
        case ViolationCode::FS_TRAVERSAL:        return "sandbox.fs.traversal";
        case ViolationCode::NET_DENIED:          return "sandbox.net.denied";
        case ViolationCode::MEMORY_SOFT_LIMIT:   return "sandbox.memory.soft_limit";
        case ViolationCode::TIMEOUT:             return "sandbox.timeout";
        case ViolationCode::SERIALIZE_ERROR:     return "sandbox.serialize_error";
        case ViolationCode::VIOLATION_THRESHOLD: return "sandbox.violation_threshold";
        default: return "sandbox.unknown";
    }
}

Severity default_severity(ViolationCode code) {
    switch (code) {
        case ViolationCode::DYNAMIC_CODE:
        case ViolationCode::TIMEOUT:
            return Severity::HIGH;
        default:
            return Severity::MEDIUM;
    }
}

ViolationEvent ViolationEvent::make(ViolationCode code, const std::string& message,
                                    std::optional<nlohmann::json> metadata) {
    ViolationEvent event;
    event.type = violation_type_for(code);
    event.severity = default_severity(code);
    event.message = message;
    event.metadata = std::move(metadata);
    event.code = code;
    return event;
}

nlohmann::json ViolationEvent::to_json() const {
    nlohmann::json j;
    j["type"] = type;
    j["severity"] = severity_to_string(severity);
    j["message"] = message;
    if (code) {
        j["code"] = violation_code_to_string(*code);
    }
    if (metadata) {
        j["metadata"] = *metadata;
    }
    return j;
}

ViolationEvent ViolationEvent::from_json(const nlohmann::json& j) {
    ViolationEvent event;
    event.type = j.value("type", "");
    event.severity = severity_from_string(j.value("severity", "medium"));
    event.message = j.value("message", "");
    if (j.contains("code")) {
        event.code = violation_code_from_string(j["code"].get<std::string>());
    }
    if (j.contains("metadata")) {
        event.metadata = j["metadata"];
    }
    return event;
}

} // namespace warden::audit
