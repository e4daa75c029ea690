#include "runtime/run_result.hpp"
#include "runtime/transfer.hpp"
#include <algorithm>

namespace warden::runtime {

const char* run_error_kind_to_string(RunErrorKind kind) {
    switch (kind) {
        case RunErrorKind::DISPOSED:            return "DISPOSED";
        case RunErrorKind::BUSY:                return "BUSY";
        case RunErrorKind::SPAWN_FAILED:        return "SPAWN_FAILED";
        case RunErrorKind::TIMEOUT:             return "TIMEOUT";
        case RunErrorKind::VIOLATION_THRESHOLD: return "VIOLATION_THRESHOLD";
        case RunErrorKind::RUNTIME_ERROR:       return "RUNTIME_ERROR";
        case RunErrorKind::SERIALIZATION:       return "SERIALIZATION";
        case RunErrorKind::POLICY_VIOLATION:    return "POLICY_VIOLATION";
        default: return "UNKNOWN";
    }
}

size_t RunResult::count(audit::ViolationCode code) const {
    return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
        [code](const audit::ViolationEvent& e) { return e.code == code; }));
}

nlohmann::json RunResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    j["duration_us"] = duration.count();

    if (error) {
        j["error"]["kind"] = run_error_kind_to_string(error->kind);
        j["error"]["message"] = error->message;
    } else {
        j["error"] = nullptr;
    }

    j["violations"] = nlohmann::json::array();
    for (const auto& violation : violations) {
        j["violations"].push_back(violation.to_json());
    }

    if (return_value) {
        auto rendered = value_to_json(*return_value);
        if (rendered) {
            j["return_value"] = *rendered;
        } else {
            j["return_value"] = return_value->to_string();
        }
    }

    return j;
}

} // namespace warden::runtime
