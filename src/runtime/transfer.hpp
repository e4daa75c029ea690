/**
 * Warden Transfer
 *
 * Decides whether a Value can safely leave the execution context and
 * produces the independent copy that crosses the boundary. A structural
 * clone is tried first; if it fails, a JSON serialize/deserialize round
 * trip is attempted (host handles with a JSON form survive it).
 */
#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "runtime/value.hpp"

namespace warden::runtime {

enum class TransferMethod {
    NONE,
    STRUCTURED_CLONE,
    JSON_ROUND_TRIP
};

const char* transfer_method_to_string(TransferMethod method);

struct TransferResult {
    bool ok = false;
    TransferMethod method = TransferMethod::NONE;
    Value value;                 // Independent copy when ok
    std::string error;           // Why both methods failed

    explicit operator bool() const { return ok; }
};

// Deep copy of plain data. Rejects cycles, functions and host handles.
std::optional<Value> structured_clone(const Value& value, std::string* error = nullptr);

// JSON form of a value. Rejects cycles, functions and host handles
// without a JSON form.
std::optional<nlohmann::json> value_to_json(const Value& value, std::string* error = nullptr);

// Same as value_to_json, but bytes stay binary so a CBOR round trip
// hands them back as bytes
std::optional<nlohmann::json> value_to_wire(const Value& value, std::string* error = nullptr);

// Rebuild a value from JSON (objects and arrays become fresh containers)
Value value_from_json(const nlohmann::json& j);

// Clone, falling back to the JSON round trip
TransferResult transfer_value(const Value& value);

} // namespace warden::runtime
