#include "runtime/sandbox.hpp"
#include "runtime/transfer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace warden::runtime {

using audit::ViolationCode;
using audit::ViolationEvent;
using audit::ViolationRecorder;
using ipc::ContextMessage;
using ipc::FailureKind;
using ipc::MessageType;

const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::IDLE:                 return "IDLE";
        case SandboxState::SPAWNED:              return "SPAWNED";
        case SandboxState::RUNNING:              return "RUNNING";
        case SandboxState::COMPLETED:            return "COMPLETED";
        case SandboxState::FAILED_TIMEOUT:       return "FAILED_TIMEOUT";
        case SandboxState::FAILED_THRESHOLD:     return "FAILED_THRESHOLD";
        case SandboxState::FAILED_RUNTIME_ERROR: return "FAILED_RUNTIME_ERROR";
        case SandboxState::FAILED_SERIALIZATION: return "FAILED_SERIALIZATION";
        case SandboxState::FAILED_POLICY:        return "FAILED_POLICY";
        case SandboxState::TORN_DOWN:            return "TORN_DOWN";
        default: return "UNKNOWN";
    }
}

// Publishes the run's context to dispose() for as long as it is alive
class Sandbox::ActiveContext {
public:
    ActiveContext(Sandbox& sandbox, ExecutionContext* context) : sandbox_(sandbox) {
        std::lock_guard<std::mutex> lock(sandbox_.active_mutex_);
        sandbox_.active_ = context;
        if (sandbox_.disposed_) {
            context->terminate();
        }
    }

    ~ActiveContext() {
        std::lock_guard<std::mutex> lock(sandbox_.active_mutex_);
        sandbox_.active_ = nullptr;
    }

    ActiveContext(const ActiveContext&) = delete;
    ActiveContext& operator=(const ActiveContext&) = delete;

private:
    Sandbox& sandbox_;
};

// ============================================================================
// Sandbox Implementation
// ============================================================================

Sandbox::Sandbox(policy::PolicyConfig policy, SandboxOptions options)
    : policy_(std::move(policy))
    , options_(std::move(options)) {
    if (auto problem = policy_.validate()) {
        throw std::invalid_argument("Invalid policy: " + *problem);
    }
    if (options_.poll_interval <= std::chrono::milliseconds(0)) {
        options_.poll_interval = std::chrono::milliseconds(1);
    }
    spdlog::debug("Sandbox {} created (timeout={}ms)", options_.name,
        policy_.max_execution_duration.count());
}

Sandbox::~Sandbox() {
    dispose();
    // A run_async() in flight still uses this sandbox; it ends promptly once disposed
    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

RunResult Sandbox::run(Submission code) {
    auto started = std::chrono::steady_clock::now();

    if (disposed_) {
        spdlog::warn("Sandbox {} is disposed, rejecting run", options_.name);
        return rejected(RunErrorKind::DISPOSED, "Sandbox has been disposed", started);
    }

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        spdlog::warn("Sandbox {} is busy, rejecting run", options_.name);
        return rejected(RunErrorKind::BUSY, "Another run is already in progress", started);
    }

    RunResult result;
    try {
        result = execute(std::move(code), started);
    } catch (const std::exception& e) {
        spdlog::error("Sandbox {} supervisor error: {}", options_.name, e.what());
        result = rejected(RunErrorKind::RUNTIME_ERROR,
            std::string("Supervisor error: ") + e.what(), started);
        last_outcome_ = SandboxState::FAILED_RUNTIME_ERROR;
        set_state(SandboxState::TORN_DOWN);
    }

    running_ = false;
    return result;
}

RunResult Sandbox::run(AsyncSubmission code) {
    if (!code) {
        return run(Submission{});
    }
    return run([code = std::move(code)](Capabilities& caps) {
        return code(caps).get();
    });
}

std::future<RunResult> Sandbox::run_async(Submission code) {
    return std::async(std::launch::async, [this, code = std::move(code)]() mutable {
        return run(std::move(code));
    });
}

void Sandbox::dispose() {
    if (disposed_.exchange(true)) {
        return;
    }

    spdlog::info("Disposing sandbox {}", options_.name);

    std::lock_guard<std::mutex> lock(active_mutex_);
    if (active_) {
        active_->terminate();
    }
}

void Sandbox::set_event_callback(SandboxEventCallback callback) {
    event_callback_ = std::move(callback);
}

RunResult Sandbox::execute(Submission code, std::chrono::steady_clock::time_point started) {
    uint64_t run_id = ++runs_;
    spdlog::debug("Sandbox {} run #{} starting", options_.name, run_id);

    // Per-run state starts fresh
    ViolationRecorder recorder(policy_.max_violations, options_.audit_callback);
    set_state(SandboxState::IDLE);

    auto context = std::make_unique<ExecutionContext>(policy_, options_.file_store);
    ActiveContext registration(*this, context.get());

    std::optional<RunError> error;
    std::optional<Value> return_value;
    SandboxState outcome = SandboxState::RUNNING;

    if (!context->start(std::move(code))) {
        error = RunError{RunErrorKind::SPAWN_FAILED, "Failed to spawn execution context"};
        outcome = SandboxState::FAILED_RUNTIME_ERROR;
    } else {
        set_state(SandboxState::SPAWNED);
        auto deadline = started + policy_.max_execution_duration;
        set_state(SandboxState::RUNNING);

        std::optional<ContextMessage> terminal;
        bool timed_out = false;

        while (true) {
            if (recorder.threshold_reached()) {
                recorder.emit_threshold_once();
                break;
            }
            if (disposed_) {
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                timed_out = true;
                break;
            }

            auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
            auto msg = context->next_message(std::min(options_.poll_interval, remaining));
            if (!msg) {
                continue;
            }

            if (msg->type == MessageType::VIOLATION) {
                recorder.emit(msg->violation);
                continue;
            }

            terminal = std::move(msg);
            break;
        }

        context->terminate();

        if (terminal) {
            if (terminal->type == MessageType::RETURNED) {
                auto transfer = transfer_value(terminal->value);
                if (transfer) {
                    return_value = std::move(transfer.value);
                    outcome = SandboxState::COMPLETED;
                } else {
                    nlohmann::json metadata;
                    metadata["reason"] = transfer.error;
                    metadata["value_type"] = value_type_to_string(terminal->value.type());
                    recorder.emit(ViolationEvent::make(ViolationCode::SERIALIZE_ERROR,
                        "Return value cannot be transferred: " + transfer.error, metadata));
                    error = RunError{RunErrorKind::SERIALIZATION,
                        "Return value is not transferable: " + transfer.error};
                    outcome = SandboxState::FAILED_SERIALIZATION;
                }
            } else if (terminal->failure == FailureKind::SERIALIZATION) {
                error = RunError{RunErrorKind::SERIALIZATION, terminal->error};
                outcome = SandboxState::FAILED_SERIALIZATION;
            } else {
                error = RunError{RunErrorKind::RUNTIME_ERROR, terminal->error};
                outcome = SandboxState::FAILED_RUNTIME_ERROR;
            }
        } else {
            // Violations the context managed to send before it was cut off
            drain_violations(*context, recorder);

            if (timed_out) {
                nlohmann::json metadata;
                metadata["max_execution_time_ms"] = policy_.max_execution_duration.count();
                recorder.emit(ViolationEvent::make(ViolationCode::TIMEOUT,
                    "Execution exceeded " + std::to_string(policy_.max_execution_duration.count()) + "ms",
                    metadata));
                error = RunError{RunErrorKind::TIMEOUT,
                    "Execution timed out after " +
                    std::to_string(policy_.max_execution_duration.count()) + "ms"};
                outcome = SandboxState::FAILED_TIMEOUT;
            } else if (recorder.threshold_reached()) {
                error = RunError{RunErrorKind::VIOLATION_THRESHOLD,
                    "Violation threshold of " + std::to_string(*policy_.max_violations) +
                    " reached"};
                outcome = SandboxState::FAILED_THRESHOLD;
            } else {
                error = RunError{RunErrorKind::DISPOSED, "Sandbox disposed during run"};
                outcome = SandboxState::FAILED_RUNTIME_ERROR;
            }
        }

        // Escalate a nominally clean run that recorded a high-severity violation
        if (outcome == SandboxState::COMPLETED) {
            if (auto high = recorder.first_high_severity()) {
                error = RunError{RunErrorKind::POLICY_VIOLATION,
                    "High-severity violation recorded: " + high->type};
                outcome = SandboxState::FAILED_POLICY;
                return_value.reset();
            }
        }
    }

    last_outcome_ = outcome;
    set_state(outcome);

    RunResult result;
    result.success = outcome == SandboxState::COMPLETED;
    result.error = std::move(error);
    result.violations = recorder.events();
    result.return_value = std::move(return_value);
    result.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.success) {
        spdlog::info("Sandbox {} run #{} completed in {}us ({} violations)",
            options_.name, run_id, result.duration.count(), result.violations.size());
    } else {
        spdlog::error("Sandbox {} run #{} failed: {} ({})", options_.name, run_id,
            run_error_kind_to_string(result.error->kind), result.error->message);
    }

    set_state(SandboxState::TORN_DOWN);
    return result;
}

RunResult Sandbox::rejected(RunErrorKind kind, const std::string& message,
                            std::chrono::steady_clock::time_point started) const {
    RunResult result;
    result.success = false;
    result.error = RunError{kind, message};
    result.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

void Sandbox::drain_violations(ExecutionContext& context, ViolationRecorder& recorder) {
    while (auto msg = context.try_next_message()) {
        if (msg->type == MessageType::VIOLATION) {
            recorder.emit(msg->violation);
        }
    }
}

void Sandbox::set_state(SandboxState new_state) {
    state_ = new_state;
    if (event_callback_) {
        event_callback_(this, new_state);
    }
}

} // namespace warden::runtime
