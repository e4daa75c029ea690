#include "policy/policy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace warden::policy {

// ============================================================================
// PolicyConfig Implementation
// ============================================================================

PolicyConfig PolicyConfig::from_json(const nlohmann::json& j) {
    PolicyConfig policy;

    // Filesystem restrictions
    if (j.contains("filesystem")) {
        auto& fs = j["filesystem"];
        if (fs.contains("read")) {
            for (const auto& p : fs["read"]) {
                policy.allowed_read_paths.insert(p.get<std::string>());
            }
        }
        if (fs.contains("files")) {
            for (const auto& [path, content] : fs["files"].items()) {
                policy.virtual_files[path] = content.get<std::string>();
            }
        }
    }

    // Network restrictions
    if (j.contains("network")) {
        for (const auto& host : j["network"]) {
            policy.network_allowlist.insert(host.get<std::string>());
        }
    }

    // Budgets
    if (j.contains("max_exec_time_ms")) {
        policy.max_execution_duration =
            std::chrono::milliseconds(j["max_exec_time_ms"].get<int64_t>());
    }
    if (j.contains("memory")) {
        auto& memory = j["memory"];
        if (memory.contains("soft_limit_bytes") && !memory["soft_limit_bytes"].is_null()) {
            policy.memory_soft_limit = memory["soft_limit_bytes"].get<uint64_t>();
        }
    }
    if (j.contains("max_violations") && !j["max_violations"].is_null()) {
        policy.max_violations = j["max_violations"].get<uint32_t>();
    }

    return policy;
}

nlohmann::json PolicyConfig::to_json() const {
    nlohmann::json j;

    j["filesystem"]["read"] = allowed_read_paths;
    j["filesystem"]["files"] = virtual_files;
    j["network"] = network_allowlist;

    j["max_exec_time_ms"] = max_execution_duration.count();
    if (memory_soft_limit) {
        j["memory"]["soft_limit_bytes"] = *memory_soft_limit;
    } else {
        j["memory"]["soft_limit_bytes"] = nullptr;
    }
    if (max_violations) {
        j["max_violations"] = *max_violations;
    } else {
        j["max_violations"] = nullptr;
    }

    return j;
}

std::optional<std::string> PolicyConfig::validate() const {
    if (max_execution_duration.count() <= 0) {
        return "max_execution_duration must be positive";
    }
    if (max_execution_duration.count() > static_cast<int64_t>(MAX_EXEC_TIME_MS)) {
        return "max_execution_duration exceeds " + std::to_string(MAX_EXEC_TIME_MS) + "ms";
    }

    for (const auto& prefix : allowed_read_paths) {
        auto normalized = PolicyChecker::normalize_path(prefix);
        if (prefix.empty() || prefix[0] != '/' || !normalized.valid || normalized.escapes_root) {
            return "allowed read path must be an absolute path: '" + prefix + "'";
        }
    }

    for (const auto& host : network_allowlist) {
        bool blank = std::all_of(host.begin(), host.end(),
            [](unsigned char c) { return std::isspace(c); });
        bool spaced = std::any_of(host.begin(), host.end(),
            [](unsigned char c) { return std::isspace(c); });
        if (blank || spaced) {
            return "network allowlist entry is not a hostname: '" + host + "'";
        }
    }

    for (const auto& entry : virtual_files) {
        if (entry.first.empty() || entry.first[0] != '/') {
            return "virtual file path must be absolute: '" + entry.first + "'";
        }
    }

    if (max_violations && *max_violations == 0) {
        return "max_violations must be at least 1 when set";
    }

    return std::nullopt;
}

bool PolicyConfig::can_read_path(const std::string& normalized_path) const {
    for (const auto& allowed : allowed_read_paths) {
        auto prefix = PolicyChecker::normalize_path(allowed);
        if (!prefix.valid) {
            continue;
        }
        if (PolicyChecker::path_under_prefix(normalized_path, prefix.path)) {
            return true;
        }
    }
    return false;
}

bool PolicyConfig::can_access_host(const std::string& host) const {
    if (host.empty()) {
        return false;
    }

    for (const auto& allowed : network_allowlist) {
        if (PolicyChecker::host_matches(host, allowed)) {
            return true;
        }
    }

    spdlog::debug("Host not in allowlist: {}", host);
    return false;
}

// ============================================================================
// PolicyChecker Implementation
// ============================================================================

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Single pass of %XX decoding; returns false on a malformed escape
bool percent_decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) {
            return false;
        }
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return true;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

NormalizedPath PolicyChecker::normalize_path(const std::string& path) {
    NormalizedPath result{"", false, false, true};

    // Decode until stable so double-encoded dots cannot slip past
    std::string decoded = path;
    for (int pass = 0; pass < 4 && decoded.find('%') != std::string::npos; ++pass) {
        std::string next;
        if (!percent_decode(decoded, next)) {
            result.valid = false;
            break;
        }
        if (next == decoded) {
            break;
        }
        decoded = std::move(next);
    }

    if (decoded.find('\0') != std::string::npos) {
        result.valid = false;
    }

    std::replace(decoded.begin(), decoded.end(), '\\', '/');
    bool absolute = !decoded.empty() && decoded[0] == '/';

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= decoded.size()) {
        size_t end = decoded.find('/', start);
        if (end == std::string::npos) {
            end = decoded.size();
        }
        std::string segment = decoded.substr(start, end - start);
        start = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            result.has_traversal = true;
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else {
                result.escapes_root = true;
                if (!absolute) {
                    segments.push_back(segment);
                }
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += segment;
    }

    if (absolute) {
        result.path = "/" + joined;
    } else {
        result.path = joined.empty() ? "." : joined;
    }
    return result;
}

bool PolicyChecker::path_under_prefix(const std::string& path, const std::string& prefix) {
    if (prefix == "/") {
        return !path.empty() && path[0] == '/';
    }
    if (path == prefix) {
        return true;
    }
    return path.size() > prefix.size() &&
           path.compare(0, prefix.size(), prefix) == 0 &&
           path[prefix.size()] == '/';
}

std::string PolicyChecker::extract_host(const std::string& url) {
    std::string rest = url;

    // Backslashes separate path segments in http(s) URLs, same as '/'
    std::replace(rest.begin(), rest.end(), '\\', '/');

    // Remove protocol
    size_t proto_end = rest.find("://");
    if (proto_end != std::string::npos) {
        rest = rest.substr(proto_end + 3);
    } else if (rest.rfind("//", 0) == 0) {
        rest = rest.substr(2);
    }

    // Remove path, query and fragment
    size_t authority_end = rest.find_first_of("/?#");
    if (authority_end != std::string::npos) {
        rest = rest.substr(0, authority_end);
    }

    // Remove userinfo
    size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        rest = rest.substr(at + 1);
    }

    std::string host;
    bool bracketed = !rest.empty() && rest[0] == '[';
    if (bracketed) {
        size_t close = rest.find(']');
        if (close == std::string::npos) {
            return "";
        }
        host = rest.substr(1, close - 1);
    } else {
        // Remove port
        host = rest.substr(0, rest.find(':'));
    }

    while (!host.empty() && host.back() == '.') {
        host.pop_back();
    }

    // Anything outside the hostname / IP literal alphabet is not a host
    bool valid = std::all_of(host.begin(), host.end(), [bracketed](unsigned char c) {
        if (bracketed) {
            return std::isxdigit(c) || c == ':' || c == '.';
        }
        return std::isalnum(c) || c == '-' || c == '.' || c == '_';
    });
    if (!valid) {
        return "";
    }
    return to_lower(host);
}

bool PolicyChecker::host_matches(const std::string& host, const std::string& pattern) {
    std::string p = to_lower(pattern);
    std::string h = to_lower(host);

    // Exact match
    if (h == p) {
        return true;
    }

    // Wildcard match (*.example.com matches sub.example.com)
    if (p.size() > 2 && p[0] == '*' && p[1] == '.') {
        std::string suffix = p.substr(1);  // .example.com
        if (h.size() > suffix.size()) {
            return h.compare(h.size() - suffix.size(), suffix.size(), suffix) == 0;
        }
    }

    return false;
}

} // namespace warden::policy
