/**
 * Warden Context Protocol
 *
 * Messages an execution context sends to its supervisor: zero or more
 * VIOLATION notices followed by exactly one terminal RETURNED or FAILED.
 *
 * Wire format (worker process -> supervisor pipe):
 *   Header: 9 bytes (magic + type + payload_size), host byte order
 *   Payload: CBOR-encoded JSON body
 */
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>
#include "audit/violation.hpp"
#include "runtime/value.hpp"

namespace warden::ipc {

constexpr uint32_t MAGIC_BYTES = 0x5744454E; // "WDEN" in hex
constexpr size_t HEADER_SIZE = 9;
constexpr size_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024; // 64MB max

enum class MessageType : uint8_t {
    VIOLATION = 0x01,   // Capability denial or blocked evaluation
    RETURNED  = 0x02,   // Terminal: transferable return value
    FAILED    = 0x03    // Terminal: code threw or value not transferable
};

enum class FailureKind : uint8_t {
    NONE,
    RUNTIME_ERROR,      // Uncaught exception in submitted code
    SERIALIZATION,      // Return value failed the transfer check
    ABORTED             // Code observed cancellation
};

struct ContextMessage {
    MessageType type = MessageType::FAILED;
    audit::ViolationEvent violation;    // VIOLATION
    runtime::Value value;               // RETURNED
    FailureKind failure = FailureKind::NONE;
    std::string error;                  // FAILED

    static ContextMessage make_violation(audit::ViolationEvent event) {
        ContextMessage msg;
        msg.type = MessageType::VIOLATION;
        msg.violation = std::move(event);
        return msg;
    }

    static ContextMessage make_returned(runtime::Value value) {
        ContextMessage msg;
        msg.type = MessageType::RETURNED;
        msg.value = std::move(value);
        return msg;
    }

    static ContextMessage make_failed(FailureKind failure, std::string error) {
        ContextMessage msg;
        msg.type = MessageType::FAILED;
        msg.failure = failure;
        msg.error = std::move(error);
        return msg;
    }

    bool is_terminal() const { return type != MessageType::VIOLATION; }
};

struct __attribute__((packed)) FrameHeader {
    uint32_t magic;         // Must be MAGIC_BYTES
    uint8_t type;           // MessageType
    uint32_t payload_size;  // Bytes following this header
};

static_assert(sizeof(FrameHeader) == HEADER_SIZE, "Header size mismatch");

// Serialize a message to wire format. Fails if the value is not
// serializable or the payload exceeds MAX_PAYLOAD_SIZE.
std::optional<std::vector<uint8_t>> encode_message(const ContextMessage& msg,
                                                   std::string* error = nullptr);

// Reassembles messages from a byte stream that may arrive in arbitrary
// chunks. After a malformed frame the decoder stays failed.
class MessageDecoder {
public:
    void feed(const uint8_t* data, size_t len);

    // Next complete message, if one has been buffered
    std::optional<ContextMessage> next();

    bool failed() const { return failed_; }
    const std::string& error() const { return error_; }

    // Bytes of an incomplete frame still buffered
    size_t pending() const { return buffer_.size() - offset_; }

private:
    std::vector<uint8_t> buffer_;
    size_t offset_ = 0;
    bool failed_ = false;
    std::string error_;

    void fail(std::string reason);
};

inline const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::VIOLATION: return "VIOLATION";
        case MessageType::RETURNED:  return "RETURNED";
        case MessageType::FAILED:    return "FAILED";
        default: return "UNKNOWN";
    }
}

inline const char* failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE:          return "NONE";
        case FailureKind::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case FailureKind::SERIALIZATION: return "SERIALIZATION";
        case FailureKind::ABORTED:       return "ABORTED";
        default: return "UNKNOWN";
    }
}

} // namespace warden::ipc
