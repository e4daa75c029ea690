/**
 * Warden Execution Context
 *
 * Runs one submitted code unit in a forked worker process against a
 * PolicyCapabilities built from a private copy of the policy. The worker
 * reports to its supervisor only through a pipe carrying framed
 * ContextMessages; a reader thread relays them into an ordered channel.
 * terminate() kills the worker outright, so code that never yields is
 * stopped as well. The worker is reaped before the context is destroyed.
 */
#pragma once
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <future>
#include <optional>
#include <functional>
#include <sys/types.h>
#include "ipc/channel.hpp"
#include "ipc/protocol.hpp"
#include "policy/policy.hpp"
#include "runtime/capabilities.hpp"
#include "runtime/file_store.hpp"
#include "runtime/value.hpp"

namespace warden::runtime {

// Submitted code: returns a value, or a pending value
using Submission = std::function<Value(Capabilities&)>;
using AsyncSubmission = std::function<std::future<Value>(Capabilities&)>;

class ExecutionContext {
public:
    ExecutionContext(policy::PolicyConfig policy, std::shared_ptr<const FileStore> store);
    ~ExecutionContext();

    // Non-copyable
    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // Fork the worker. Returns false if no process could be created.
    bool start(Submission code);

    // Next message from the worker, waiting at most `wait`
    std::optional<ipc::ContextMessage> next_message(std::chrono::milliseconds wait);

    // Next already-queued message, without waiting
    std::optional<ipc::ContextMessage> try_next_message();

    // Kill the worker and stop accepting its messages
    void terminate();

    bool started() const { return started_; }
    bool terminated() const { return terminated_; }

    // Worker process ID (-1 before start)
    pid_t pid() const { return child_pid_; }

    // True until the worker process has been reaped
    bool running() const;

private:
    policy::PolicyConfig policy_;
    std::shared_ptr<const FileStore> store_;
    ipc::Channel<ipc::ContextMessage> channel_;
    std::thread reader_;

    pid_t child_pid_ = -1;
    int read_fd_ = -1;
    bool started_ = false;
    std::atomic<bool> terminated_{false};

    // Guards the window between the worker exiting and being reaped, so a
    // late kill() never reaches a recycled PID
    mutable std::mutex process_mutex_;
    bool reaped_ = false;

    void reader_main();
    void kill_worker();
    bool worker_exited() const;
    int reap();

    // Runs in the forked worker; never returns
    static void child_main(int write_fd, pid_t supervisor,
                           const policy::PolicyConfig& policy,
                           const std::shared_ptr<const FileStore>& store,
                           const Submission& code) noexcept;
};

} // namespace warden::runtime
