/**
 * Warden Policy
 *
 * Immutable per-run security policy: readable path prefixes, network host
 * allowlist, virtual file table and the time/memory/violation budgets.
 * Also hosts the path and host matching helpers used by capability checks.
 */
#pragma once
#include <string>
#include <vector>
#include <set>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace warden::policy {

// Default wall-clock budget when a policy file does not set one
constexpr uint64_t DEFAULT_MAX_EXEC_TIME_MS = 30000;

// Longest accepted budget (one year); keeps deadlines representable
constexpr uint64_t MAX_EXEC_TIME_MS = 365ULL * 24 * 60 * 60 * 1000;

struct PolicyConfig {
    // Filesystem restrictions
    std::set<std::string> allowed_read_paths;           // Path prefixes, empty = nothing readable
    std::map<std::string, std::string> virtual_files;   // Path -> content

    // Network restrictions
    std::set<std::string> network_allowlist;            // Hostnames, "*.example.com" allowed

    // Budgets
    std::chrono::milliseconds max_execution_duration{DEFAULT_MAX_EXEC_TIME_MS};
    std::optional<uint64_t> memory_soft_limit;          // Bytes
    std::optional<uint32_t> max_violations;

    // Create from JSON (throws nlohmann::json::exception on malformed input)
    static PolicyConfig from_json(const nlohmann::json& j);

    // Serialize to JSON
    nlohmann::json to_json() const;

    // Returns a description of the first problem, or nullopt if the policy is usable
    std::optional<std::string> validate() const;

    // Check if a normalized path lies under an allowed prefix
    bool can_read_path(const std::string& normalized_path) const;

    // Check if a host is in the allowlist
    bool can_access_host(const std::string& host) const;
};

// Result of lexical path normalization
struct NormalizedPath {
    std::string path;         // Canonical form ("/a/b", or relative "a/b", "../x")
    bool has_traversal;       // Input contained a ".." segment
    bool escapes_root;        // A ".." segment tried to climb above the start
    bool valid;               // False for embedded NUL or bad percent-encoding
};

// Path and host matching utility
class PolicyChecker {
public:
    // Decode %XX escapes, unify separators, resolve "." and ".." lexically
    static NormalizedPath normalize_path(const std::string& path);

    // Segment-aware prefix match ("/a" matches "/a" and "/a/b" but not "/ab")
    static bool path_under_prefix(const std::string& path, const std::string& prefix);

    // Extract lower-cased host from URL
    static std::string extract_host(const std::string& url);

    // Check if host matches pattern (supports wildcards like *.example.com)
    static bool host_matches(const std::string& host, const std::string& pattern);
};

} // namespace warden::policy
