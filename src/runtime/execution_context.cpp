#include "runtime/execution_context.hpp"
#include "runtime/ambient.hpp"
#include "runtime/transfer.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace warden::runtime {

using audit::ViolationCode;
using audit::ViolationEvent;
using ipc::ContextMessage;
using ipc::FailureKind;
using ipc::MessageType;

namespace {

constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

// How often the reader checks whether a silent worker has exited
constexpr int READER_POLL_MS = 20;

bool write_all(int fd, const std::vector<uint8_t>& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

std::string describe_exit(int status) {
    if (WIFSIGNALED(status)) {
        return "execution context killed by signal " + std::to_string(WTERMSIG(status));
    }
    if (WIFEXITED(status)) {
        return "execution context exited with status " + std::to_string(WEXITSTATUS(status)) +
               " without a result";
    }
    return "execution context ended without a result";
}

} // namespace

ExecutionContext::ExecutionContext(policy::PolicyConfig policy,
                                   std::shared_ptr<const FileStore> store)
    : policy_(std::move(policy))
    , store_(std::move(store)) {}

ExecutionContext::~ExecutionContext() {
    terminate();
    if (reader_.joinable()) {
        reader_.join();
    }
    if (read_fd_ >= 0) {
        close(read_fd_);
    }
}

bool ExecutionContext::start(Submission code) {
    if (started_) {
        spdlog::error("Execution context already started");
        return false;
    }

    int pipe_fd[2];
    if (pipe2(pipe_fd, O_CLOEXEC) < 0) {
        spdlog::error("pipe() failed: {}", strerror(errno));
        return false;
    }

    pid_t supervisor = getpid();
    pid_t pid = fork();

    if (pid < 0) {
        spdlog::error("fork() failed: {}", strerror(errno));
        close(pipe_fd[0]);
        close(pipe_fd[1]);
        return false;
    }

    if (pid == 0) {
        // Child process
        close(pipe_fd[0]);
        child_main(pipe_fd[1], supervisor, policy_, store_, code);
        _exit(0);
    }

    close(pipe_fd[1]);
    child_pid_ = pid;
    read_fd_ = pipe_fd[0];
    started_ = true;

    try {
        reader_ = std::thread(&ExecutionContext::reader_main, this);
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start execution context reader: {}", e.what());
        kill_worker();
        reap();
        return false;
    }

    spdlog::debug("Execution context spawned (PID={})", pid);
    return true;
}

std::optional<ContextMessage> ExecutionContext::next_message(std::chrono::milliseconds wait) {
    return channel_.pop_for(wait);
}

std::optional<ContextMessage> ExecutionContext::try_next_message() {
    return channel_.try_pop();
}

void ExecutionContext::terminate() {
    terminated_ = true;
    channel_.close();
    kill_worker();
}

bool ExecutionContext::running() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return started_ && !reaped_;
}

void ExecutionContext::kill_worker() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (child_pid_ <= 0 || reaped_) {
        return;
    }
    if (kill(child_pid_, SIGKILL) < 0 && errno != ESRCH) {
        spdlog::error("kill(SIGKILL) failed for PID {}: {}", child_pid_, strerror(errno));
    }
}

// ============================================================================
// Supervisor side: relay worker messages into the channel
// ============================================================================

void ExecutionContext::reader_main() {
    ipc::MessageDecoder decoder;
    bool terminal_seen = false;
    std::vector<uint8_t> buffer(READ_CHUNK_SIZE);

    // False once the pipe is closed or the stream is unusable
    auto read_available = [&]() {
        ssize_t n = read(read_fd_, buffer.data(), buffer.size());
        if (n < 0) {
            return errno == EINTR;
        }
        if (n == 0) {
            return false;
        }
        decoder.feed(buffer.data(), static_cast<size_t>(n));
        while (auto msg = decoder.next()) {
            terminal_seen = terminal_seen || msg->is_terminal();
            channel_.push(std::move(*msg));
        }
        return !decoder.failed();
    };

    bool open = true;
    while (open) {
        pollfd pfd{read_fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, READER_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll() on execution context pipe failed: {}", strerror(errno));
            break;
        }
        if (rc > 0) {
            open = read_available();
            continue;
        }

        // Another process may still hold the write end; the worker's exit ends the stream
        if (worker_exited()) {
            while (open) {
                pollfd drain{read_fd_, POLLIN, 0};
                if (poll(&drain, 1, 0) <= 0) {
                    break;
                }
                open = read_available();
            }
            break;
        }
    }

    if (decoder.failed()) {
        spdlog::error("Execution context {} sent a malformed message: {}", child_pid_,
            decoder.error());
        kill_worker();
    }

    int status = reap();
    spdlog::debug("Execution context {} reaped ({})", child_pid_, describe_exit(status));

    if (!terminal_seen) {
        std::string reason = decoder.failed()
            ? "malformed message from execution context: " + decoder.error()
            : describe_exit(status);
        channel_.push(ContextMessage::make_failed(FailureKind::RUNTIME_ERROR, reason));
    }
}

bool ExecutionContext::worker_exited() const {
    siginfo_t info{};
    if (waitid(P_PID, static_cast<id_t>(child_pid_), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
        return errno == ECHILD;
    }
    return info.si_pid == child_pid_;
}

int ExecutionContext::reap() {
    // Wait without reaping first, so kill_worker() never targets a freed PID
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(child_pid_), &info, WEXITED | WNOWAIT) < 0 &&
           errno == EINTR) {
    }

    std::lock_guard<std::mutex> lock(process_mutex_);
    int status = 0;
    while (waitpid(child_pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", child_pid_, strerror(errno));
            break;
        }
    }
    reaped_ = true;
    return status;
}

// ============================================================================
// Worker process
// ============================================================================

void ExecutionContext::child_main(int write_fd, pid_t supervisor,
                                  const policy::PolicyConfig& policy,
                                  const std::shared_ptr<const FileStore>& store,
                                  const Submission& code) noexcept {
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (getppid() != supervisor) {
        _exit(1);
    }
    signal(SIGPIPE, SIG_IGN);

    std::mutex write_mutex;
    auto send = [&](const ContextMessage& msg) {
        auto frame = ipc::encode_message(msg);
        if (!frame && msg.type == MessageType::VIOLATION) {
            // Metadata too large for one frame; the event still goes out
            ContextMessage trimmed = msg;
            trimmed.violation.metadata.reset();
            frame = ipc::encode_message(trimmed);
        }
        if (!frame) {
            return false;
        }
        std::lock_guard<std::mutex> lock(write_mutex);
        return write_all(write_fd, *frame);
    };

    {
        PolicyCapabilities capabilities(
            policy, store,
            [&send](const ViolationEvent& event) {
                send(ContextMessage::make_violation(event));
            },
            [supervisor]() { return getppid() != supervisor; });

        AmbientScope scope(&capabilities);

        try {
            if (!code) {
                throw std::invalid_argument("empty submission");
            }
            Value result = code(capabilities);

            auto transfer = transfer_value(result);
            std::string reason = transfer.error;
            bool delivered = false;

            if (transfer) {
                spdlog::trace("Return value transferred via {}",
                    transfer_method_to_string(transfer.method));
                auto frame = ipc::encode_message(
                    ContextMessage::make_returned(std::move(transfer.value)), &reason);
                if (frame) {
                    std::lock_guard<std::mutex> lock(write_mutex);
                    delivered = write_all(write_fd, *frame);
                }
            }

            if (!delivered) {
                nlohmann::json metadata;
                metadata["reason"] = reason;
                metadata["value_type"] = value_type_to_string(result.type());
                send(ContextMessage::make_violation(ViolationEvent::make(
                    ViolationCode::SERIALIZE_ERROR,
                    "Return value cannot be transferred: " + reason, metadata)));
                send(ContextMessage::make_failed(FailureKind::SERIALIZATION,
                    "Return value is not transferable: " + reason));
            }
        } catch (const RunAborted& e) {
            send(ContextMessage::make_failed(FailureKind::ABORTED, e.what()));
        } catch (const std::exception& e) {
            send(ContextMessage::make_failed(FailureKind::RUNTIME_ERROR, e.what()));
        } catch (...) {
            send(ContextMessage::make_failed(FailureKind::RUNTIME_ERROR,
                "submitted code threw a non-standard exception"));
        }
    }

    close(write_fd);
    _exit(0);
}

} // namespace warden::runtime
