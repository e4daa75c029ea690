#include "ipc/protocol.hpp"
#include "runtime/transfer.hpp"
#include <nlohmann/json.hpp>
#include <cstring>

namespace warden::ipc {

using json = nlohmann::json;

namespace {

void set_error(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

} // namespace

std::optional<std::vector<uint8_t>> encode_message(const ContextMessage& msg, std::string* error) {
    json body = json::object();
    switch (msg.type) {
        case MessageType::VIOLATION:
            body["violation"] = msg.violation.to_json();
            break;
        case MessageType::RETURNED: {
            std::string reason;
            auto value = runtime::value_to_wire(msg.value, &reason);
            if (!value) {
                set_error(error, reason);
                return std::nullopt;
            }
            body["value"] = std::move(*value);
            break;
        }
        case MessageType::FAILED:
            body["failure"] = static_cast<int>(msg.failure);
            body["error"] = msg.error;
            break;
    }

    std::vector<uint8_t> payload;
    try {
        payload = json::to_cbor(body);
    } catch (const json::exception& e) {
        set_error(error, std::string("cannot encode message: ") + e.what());
        return std::nullopt;
    }

    if (payload.size() > MAX_PAYLOAD_SIZE) {
        set_error(error, "message of " + std::to_string(payload.size()) +
                         " bytes exceeds the " + std::to_string(MAX_PAYLOAD_SIZE) + " byte limit");
        return std::nullopt;
    }

    FrameHeader header;
    header.magic = MAGIC_BYTES;
    header.type = static_cast<uint8_t>(msg.type);
    header.payload_size = static_cast<uint32_t>(payload.size());

    std::vector<uint8_t> frame(HEADER_SIZE + payload.size());
    std::memcpy(frame.data(), &header, HEADER_SIZE);
    if (!payload.empty()) {
        std::memcpy(frame.data() + HEADER_SIZE, payload.data(), payload.size());
    }
    return frame;
}

// ============================================================================
// MessageDecoder
// ============================================================================

void MessageDecoder::feed(const uint8_t* data, size_t len) {
    if (failed_ || len == 0) {
        return;
    }
    if (offset_ > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
        offset_ = 0;
    }
    buffer_.insert(buffer_.end(), data, data + len);
}

std::optional<ContextMessage> MessageDecoder::next() {
    if (failed_ || pending() < HEADER_SIZE) {
        return std::nullopt;
    }

    FrameHeader header;
    std::memcpy(&header, buffer_.data() + offset_, HEADER_SIZE);

    if (header.magic != MAGIC_BYTES) {
        fail("invalid frame magic");
        return std::nullopt;
    }
    if (header.payload_size > MAX_PAYLOAD_SIZE) {
        fail("frame payload of " + std::to_string(header.payload_size) + " bytes exceeds limit");
        return std::nullopt;
    }
    if (header.type < static_cast<uint8_t>(MessageType::VIOLATION) ||
        header.type > static_cast<uint8_t>(MessageType::FAILED)) {
        fail("unknown message type " + std::to_string(header.type));
        return std::nullopt;
    }
    if (pending() < HEADER_SIZE + header.payload_size) {
        return std::nullopt;
    }

    const uint8_t* payload = buffer_.data() + offset_ + HEADER_SIZE;
    offset_ += HEADER_SIZE + header.payload_size;

    ContextMessage msg;
    msg.type = static_cast<MessageType>(header.type);
    try {
        json body = json::from_cbor(payload, payload + header.payload_size);
        switch (msg.type) {
            case MessageType::VIOLATION:
                msg.violation = audit::ViolationEvent::from_json(body.at("violation"));
                break;
            case MessageType::RETURNED:
                msg.value = runtime::value_from_json(body.at("value"));
                break;
            case MessageType::FAILED: {
                int failure = body.at("failure").get<int>();
                if (failure < static_cast<int>(FailureKind::NONE) ||
                    failure > static_cast<int>(FailureKind::ABORTED)) {
                    fail("unknown failure kind " + std::to_string(failure));
                    return std::nullopt;
                }
                msg.failure = static_cast<FailureKind>(failure);
                msg.error = body.at("error").get<std::string>();
                break;
            }
        }
    } catch (const json::exception& e) {
        fail(std::string("malformed payload: ") + e.what());
        return std::nullopt;
    }

    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    return msg;
}

void MessageDecoder::fail(std::string reason) {
    failed_ = true;
    error_ = std::move(reason);
    buffer_.clear();
    offset_ = 0;
}

} // namespace warden::ipc
