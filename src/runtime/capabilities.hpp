/**
 * Warden Capabilities
 *
 * The only operations sandboxed code can perform: read a file, list files,
 * fetch a URL, account an allocation. PolicyCapabilities checks each call
 * against the run's policy; a denial is recorded through the violation sink
 * before the CapabilityError reaches the caller, so catching the error does
 * not erase the audit trail.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <optional>
#include <functional>
#include <stdexcept>
#include <cstdint>
#include "audit/violation.hpp"
#include "policy/policy.hpp"
#include "runtime/file_store.hpp"

namespace warden::runtime {

// Thrown at the call site for a denied or failed capability call
class CapabilityError : public std::runtime_error {
public:
    CapabilityError(const std::string& message, std::optional<audit::ViolationCode> code)
        : std::runtime_error(message), code_(code) {}

    // Set when the failure was a policy denial (and therefore audited)
    const std::optional<audit::ViolationCode>& code() const { return code_; }

private:
    std::optional<audit::ViolationCode> code_;
};

// Thrown by every capability once the supervisor has cancelled the run
class RunAborted : public std::runtime_error {
public:
    RunAborted() : std::runtime_error("run aborted by supervisor") {}
};

struct FetchResponse {
    int status = 0;
    std::string url;
    std::string host;
    std::string body;
};

class Capabilities {
public:
    virtual ~Capabilities() = default;

    virtual std::string read_file(const std::string& path) = 0;
    virtual std::vector<std::string> list_files(const std::string& prefix) = 0;
    virtual FetchResponse fetch(const std::string& url) = 0;

    // Returns the run's cumulative allocation after this call
    virtual uint64_t alloc(uint64_t bytes) = 0;
};

using ViolationSink = std::function<void(const audit::ViolationEvent&)>;
using CancelProbe = std::function<bool()>;

class PolicyCapabilities : public Capabilities {
public:
    PolicyCapabilities(policy::PolicyConfig policy,
                       std::shared_ptr<const FileStore> store,
                       ViolationSink sink,
                       CancelProbe cancelled = nullptr);

    std::string read_file(const std::string& path) override;
    std::vector<std::string> list_files(const std::string& prefix) override;
    FetchResponse fetch(const std::string& url) override;
    uint64_t alloc(uint64_t bytes) override;

    // Record a blocked dynamic evaluation; returns the error to throw
    CapabilityError deny_dynamic_code(const std::string& primitive, const std::string& source);

    uint64_t allocated() const { return allocated_.load(); }

private:
    const policy::PolicyConfig policy_;
    std::shared_ptr<const FileStore> store_;
    ViolationSink sink_;
    CancelProbe cancelled_;
    std::atomic<uint64_t> allocated_{0};

    void check_cancelled() const;
    CapabilityError deny(audit::ViolationCode code, const std::string& message,
                         nlohmann::json metadata);
};

} // namespace warden::runtime
