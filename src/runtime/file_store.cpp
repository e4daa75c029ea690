#include "runtime/file_store.hpp"
#include "policy/policy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace warden::runtime {

using policy::PolicyChecker;

// ============================================================================
// VirtualFileStore Implementation
// ============================================================================

VirtualFileStore::VirtualFileStore(const std::map<std::string, std::string>& files) {
    for (const auto& [path, content] : files) {
        auto normalized = PolicyChecker::normalize_path(path);
        if (!normalized.valid) {
            spdlog::warn("Skipping virtual file with invalid path: {}", path);
            continue;
        }
        files_[normalized.path] = content;
    }
}

std::optional<std::string> VirtualFileStore::read(const std::string& path) const {
    auto it = files_.find(path);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> VirtualFileStore::list(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& entry : files_) {
        if (PolicyChecker::path_under_prefix(entry.first, prefix)) {
            result.push_back(entry.first);
        }
    }
    return result;
}

// ============================================================================
// HostFileStore Implementation
// ============================================================================

HostFileStore::HostFileStore(const std::string& root_path) : root_(root_path) {
    std::error_code ec;
    auto canonical = fs::canonical(root_path, ec);
    if (!ec) {
        root_ = canonical.string();
    } else {
        spdlog::warn("HostFileStore root {} not resolvable: {}", root_path, ec.message());
    }
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
}

std::string HostFileStore::host_path(const std::string& path) const {
    // Normalized sandbox paths never contain "..", so appending stays under root_
    return root_ + path;
}

std::optional<std::string> HostFileStore::read(const std::string& path) const {
    if (path.empty() || path[0] != '/') {
        return std::nullopt;
    }

    std::string full = host_path(path);
    std::error_code ec;

    // Refuse symlinks that resolve outside the root
    auto resolved = fs::canonical(full, ec);
    if (ec || !fs::is_regular_file(resolved, ec)) {
        return std::nullopt;
    }
    auto resolved_str = resolved.string();
    if (!PolicyChecker::path_under_prefix(resolved_str, root_)) {
        spdlog::warn("HostFileStore refusing {} (resolves outside {})", path, root_);
        return std::nullopt;
    }

    std::ifstream file(resolved, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return content;
}

std::vector<std::string> HostFileStore::list(const std::string& prefix) const {
    std::vector<std::string> result;
    if (prefix.empty() || prefix[0] != '/') {
        return result;
    }

    std::error_code ec;
    fs::path base(prefix == "/" ? root_ : host_path(prefix));

    // Only entries read() would serve: symlinks must resolve inside the root
    auto stays_inside = [this](const fs::path& path) {
        std::error_code resolve_ec;
        auto resolved = fs::canonical(path, resolve_ec);
        return !resolve_ec && PolicyChecker::path_under_prefix(resolved.string(), root_);
    };

    if (fs::is_regular_file(base, ec)) {
        if (stays_inside(base)) {
            result.push_back(prefix);
        }
        return result;
    }

    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return result;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::debug("HostFileStore listing stopped under {}: {}", prefix, ec.message());
            break;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (it->is_symlink(ec) && !stays_inside(it->path())) {
            continue;
        }
        std::string full = it->path().string();
        if (full.size() > root_.size() && full.compare(0, root_.size(), root_) == 0) {
            std::string relative = full.substr(root_.size());
            if (root_ == "/") {
                relative = full;
            }
            result.push_back(relative);
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

} // namespace warden::runtime
