#include "runtime/capabilities.hpp"
#include <spdlog/spdlog.h>
#include <limits>

namespace warden::runtime {

using audit::ViolationCode;
using audit::ViolationEvent;
using policy::PolicyChecker;

// Longest excerpt of blocked source kept in violation metadata
constexpr size_t MAX_SOURCE_EXCERPT = 256;

PolicyCapabilities::PolicyCapabilities(policy::PolicyConfig policy,
                                       std::shared_ptr<const FileStore> store,
                                       ViolationSink sink,
                                       CancelProbe cancelled)
    : policy_(std::move(policy))
    , store_(std::move(store))
    , sink_(std::move(sink))
    , cancelled_(std::move(cancelled)) {
    if (!store_) {
        store_ = std::make_shared<VirtualFileStore>(policy_.virtual_files);
    }
}

void PolicyCapabilities::check_cancelled() const {
    if (cancelled_ && cancelled_()) {
        throw RunAborted();
    }
}

CapabilityError PolicyCapabilities::deny(ViolationCode code, const std::string& message,
                                         nlohmann::json metadata) {
    if (sink_) {
        sink_(ViolationEvent::make(code, message, std::move(metadata)));
    }
    return CapabilityError(message, code);
}

std::string PolicyCapabilities::read_file(const std::string& path) {
    check_cancelled();

    auto normalized = PolicyChecker::normalize_path(path);

    nlohmann::json metadata;
    metadata["path"] = path;
    metadata["normalized"] = normalized.path;

    if (!normalized.valid) {
        throw deny(ViolationCode::FS_DENIED, "Read denied: malformed path", metadata);
    }

    if (policy_.can_read_path(normalized.path)) {
        auto content = store_->read(normalized.path);
        if (!content) {
            throw CapabilityError("File not found: " + normalized.path, std::nullopt);
        }
        spdlog::debug("Sandbox read {} ({} bytes)", normalized.path, content->size());
        return *content;
    }

    if (normalized.has_traversal) {
        throw deny(ViolationCode::FS_TRAVERSAL,
                   "Read denied: path traversal outside allowed paths: " + path, metadata);
    }
    throw deny(ViolationCode::FS_DENIED,
               "Read denied: path not allowed for reading: " + normalized.path, metadata);
}

std::vector<std::string> PolicyCapabilities::list_files(const std::string& prefix) {
    check_cancelled();

    std::string rooted = (!prefix.empty() && prefix[0] == '/') ? prefix : "/" + prefix;
    auto normalized = PolicyChecker::normalize_path(rooted);
    if (!normalized.valid) {
        return {};
    }

    // Listing reveals nothing the policy would not let the code read
    std::vector<std::string> visible;
    for (auto& path : store_->list(normalized.path)) {
        if (policy_.can_read_path(path)) {
            visible.push_back(std::move(path));
        }
    }
    return visible;
}

FetchResponse PolicyCapabilities::fetch(const std::string& url) {
    check_cancelled();

    std::string host = PolicyChecker::extract_host(url);
    if (!policy_.can_access_host(host)) {
        nlohmann::json metadata;
        metadata["url"] = url;
        metadata["host"] = host;
        throw deny(ViolationCode::NET_DENIED,
                   "Fetch denied: host not in allowlist: " + (host.empty() ? url : host),
                   metadata);
    }

    spdlog::debug("Sandbox fetch {} (host {})", url, host);

    // Policy layer only; transport is the host's concern
    FetchResponse response;
    response.status = 200;
    response.url = url;
    response.host = host;
    return response;
}

uint64_t PolicyCapabilities::alloc(uint64_t bytes) {
    check_cancelled();

    uint64_t previous = allocated_.load();
    uint64_t total;
    do {
        total = previous > std::numeric_limits<uint64_t>::max() - bytes
            ? std::numeric_limits<uint64_t>::max()
            : previous + bytes;
    } while (!allocated_.compare_exchange_weak(previous, total));

    if (policy_.memory_soft_limit && total > *policy_.memory_soft_limit) {
        nlohmann::json metadata;
        metadata["requested"] = bytes;
        metadata["total"] = total;
        metadata["limit"] = *policy_.memory_soft_limit;
        throw deny(ViolationCode::MEMORY_SOFT_LIMIT,
                   "Allocation of " + std::to_string(bytes) + " bytes exceeds soft limit (" +
                   std::to_string(total) + " > " +
                   std::to_string(*policy_.memory_soft_limit) + ")",
                   metadata);
    }

    return total;
}

CapabilityError PolicyCapabilities::deny_dynamic_code(const std::string& primitive,
                                                      const std::string& source) {
    check_cancelled();

    nlohmann::json metadata;
    metadata["primitive"] = primitive;
    metadata["source"] = source.substr(0, MAX_SOURCE_EXCERPT);
    return deny(ViolationCode::DYNAMIC_CODE,
                "Dynamic code evaluation blocked: " + primitive, metadata);
}

} // namespace warden::runtime
