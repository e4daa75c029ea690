/**
 * Warden Sandbox
 *
 * Supervisor for policy-enforced runs. Each run spawns an execution context,
 * relays its violations through the single emission path, and races three
 * conditions: the deadline, the violation threshold, and the context's
 * terminal message. The first one to fire decides the run's outcome.
 */
#pragma once
#include <string>
#include <memory>
#include <atomic>
#include <mutex>
#include <chrono>
#include <future>
#include <functional>
#include <cstdint>
#include "audit/violation.hpp"
#include "audit/violation_recorder.hpp"
#include "policy/policy.hpp"
#include "runtime/execution_context.hpp"
#include "runtime/file_store.hpp"
#include "runtime/run_result.hpp"

namespace warden::runtime {

// Per-run state machine
enum class SandboxState {
    IDLE,
    SPAWNED,
    RUNNING,
    COMPLETED,
    FAILED_TIMEOUT,
    FAILED_THRESHOLD,
    FAILED_RUNTIME_ERROR,
    FAILED_SERIALIZATION,
    FAILED_POLICY,          // High-severity violation on a nominally clean run
    TORN_DOWN
};

const char* sandbox_state_to_string(SandboxState state);

struct SandboxOptions {
    std::string name = "sandbox";                       // Used in logs
    audit::AuditCallback audit_callback;                // Invoked per violation, in order
    std::shared_ptr<const FileStore> file_store;        // Null = policy's virtual files
    std::chrono::milliseconds poll_interval{5};         // Max wait per supervisor iteration
};

// Forward declaration
class Sandbox;

// Callback for state transitions
using SandboxEventCallback = std::function<void(Sandbox*, SandboxState)>;

class Sandbox {
public:
    // Throws std::invalid_argument if the policy does not validate
    explicit Sandbox(policy::PolicyConfig policy, SandboxOptions options = {});
    ~Sandbox();

    // Non-copyable
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Execute one submission. Never throws; every failure is in the result.
    RunResult run(Submission code);
    RunResult run(AsyncSubmission code);

    // run() on a separate thread; the sandbox must outlive the future
    std::future<RunResult> run_async(Submission code);

    // Terminal and idempotent; cancels a run in progress
    void dispose();
    bool disposed() const { return disposed_; }

    // Status
    SandboxState state() const { return state_; }
    SandboxState last_outcome() const { return last_outcome_; }
    const policy::PolicyConfig& policy() const { return policy_; }
    const std::string& name() const { return options_.name; }
    uint64_t run_count() const { return runs_; }

    // Event callback
    void set_event_callback(SandboxEventCallback callback);

private:
    const policy::PolicyConfig policy_;
    SandboxOptions options_;
    std::atomic<SandboxState> state_{SandboxState::IDLE};
    std::atomic<SandboxState> last_outcome_{SandboxState::IDLE};
    std::atomic<bool> disposed_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runs_{0};
    SandboxEventCallback event_callback_;

    // Context of the run in progress, for dispose()
    std::mutex active_mutex_;
    ExecutionContext* active_ = nullptr;

    class ActiveContext;

    RunResult execute(Submission code, std::chrono::steady_clock::time_point started);
    RunResult rejected(RunErrorKind kind, const std::string& message,
                       std::chrono::steady_clock::time_point started) const;
    void drain_violations(ExecutionContext& context, audit::ViolationRecorder& recorder);
    void set_state(SandboxState new_state);
};

} // namespace warden::runtime
