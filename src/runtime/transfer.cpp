#include "runtime/transfer.hpp"
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace warden::runtime {

using json = nlohmann::json;

// Deeper nesting is rejected rather than risking the worker's stack
constexpr size_t MAX_TRANSFER_DEPTH = 512;

const char* transfer_method_to_string(TransferMethod method) {
    switch (method) {
        case TransferMethod::NONE:             return "none";
        case TransferMethod::STRUCTURED_CLONE: return "structured_clone";
        case TransferMethod::JSON_ROUND_TRIP:  return "json_round_trip";
        default: return "unknown";
    }
}

namespace {

void set_error(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

// Tracks the containers on the current path; revisiting one means a cycle
class PathGuard {
public:
    explicit PathGuard(std::unordered_set<const void*>& ancestors) : ancestors_(ancestors) {}

    ~PathGuard() {
        if (entered_) {
            ancestors_.erase(entered_);
        }
    }

    PathGuard(const PathGuard&) = delete;
    PathGuard& operator=(const PathGuard&) = delete;

    bool enter(const void* id) {
        if (!ancestors_.insert(id).second) {
            return false;
        }
        entered_ = id;
        return true;
    }

private:
    std::unordered_set<const void*>& ancestors_;
    const void* entered_ = nullptr;
};

bool clone_into(const Value& value, Value& out, std::unordered_set<const void*>& ancestors,
                size_t depth, std::string* error) {
    if (depth > MAX_TRANSFER_DEPTH) {
        set_error(error, "value nesting exceeds transfer depth limit");
        return false;
    }

    switch (value.type()) {
        case ValueType::NUL:
        case ValueType::BOOL:
        case ValueType::INT:
        case ValueType::DOUBLE:
        case ValueType::STRING:
            out = value;
            return true;

        case ValueType::BYTES:
            out = Value::bytes(value.as_bytes());
            return true;

        case ValueType::FUNCTION:
            set_error(error, "functions cannot be cloned");
            return false;

        case ValueType::HOST:
            set_error(error, "host handle '" + value.as_host()->type_name() + "' cannot be cloned");
            return false;

        default:
            break;
    }

    PathGuard guard(ancestors);
    if (!guard.enter(value.identity())) {
        set_error(error, "value contains a cycle");
        return false;
    }

    if (value.is_array()) {
        Array items;
        items.reserve(value.size());
        for (const auto& item : value.as_array()) {
            Value copy;
            if (!clone_into(item, copy, ancestors, depth + 1, error)) {
                return false;
            }
            items.push_back(std::move(copy));
        }
        out = Value(std::move(items));
        return true;
    }

    Object fields;
    for (const auto& [key, item] : value.as_object()) {
        Value copy;
        if (!clone_into(item, copy, ancestors, depth + 1, error)) {
            return false;
        }
        fields.emplace(key, std::move(copy));
    }
    out = Value(std::move(fields));
    return true;
}

bool to_json_into(const Value& value, json& out, std::unordered_set<const void*>& ancestors,
                  size_t depth, bool binary_bytes, std::string* error) {
    if (depth > MAX_TRANSFER_DEPTH) {
        set_error(error, "value nesting exceeds transfer depth limit");
        return false;
    }

    switch (value.type()) {
        case ValueType::NUL:    out = nullptr; return true;
        case ValueType::BOOL:   out = value.as_bool(); return true;
        case ValueType::INT:    out = value.as_int(); return true;
        case ValueType::DOUBLE: out = value.as_double(); return true;
        case ValueType::STRING: out = value.as_string(); return true;
        case ValueType::BYTES:
            if (binary_bytes) {
                out = json::binary(value.as_bytes());
            } else {
                out = value.as_bytes();
            }
            return true;

        case ValueType::FUNCTION:
            set_error(error, "functions are not serializable");
            return false;

        case ValueType::HOST: {
            auto host_json = value.as_host()->to_json();
            if (!host_json) {
                set_error(error, "host handle '" + value.as_host()->type_name() +
                                 "' is not serializable");
                return false;
            }
            out = std::move(*host_json);
            return true;
        }

        default:
            break;
    }

    PathGuard guard(ancestors);
    if (!guard.enter(value.identity())) {
        set_error(error, "value contains a cycle");
        return false;
    }

    if (value.is_array()) {
        out = json::array();
        for (const auto& item : value.as_array()) {
            json element;
            if (!to_json_into(item, element, ancestors, depth + 1, binary_bytes, error)) {
                return false;
            }
            out.push_back(std::move(element));
        }
        return true;
    }

    out = json::object();
    for (const auto& [key, item] : value.as_object()) {
        json element;
        if (!to_json_into(item, element, ancestors, depth + 1, binary_bytes, error)) {
            return false;
        }
        out[key] = std::move(element);
    }
    return true;
}

} // namespace

std::optional<Value> structured_clone(const Value& value, std::string* error) {
    std::unordered_set<const void*> ancestors;
    Value out;
    if (!clone_into(value, out, ancestors, 0, error)) {
        return std::nullopt;
    }
    return out;
}

std::optional<json> value_to_json(const Value& value, std::string* error) {
    std::unordered_set<const void*> ancestors;
    json out;
    if (!to_json_into(value, out, ancestors, 0, false, error)) {
        return std::nullopt;
    }
    return out;
}

std::optional<json> value_to_wire(const Value& value, std::string* error) {
    std::unordered_set<const void*> ancestors;
    json out;
    if (!to_json_into(value, out, ancestors, 0, true, error)) {
        return std::nullopt;
    }
    return out;
}

Value value_from_json(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return Value();
        case json::value_t::boolean:
            return Value(j.get<bool>());
        case json::value_t::number_integer:
            return Value(j.get<int64_t>());
        case json::value_t::number_unsigned: {
            auto u = j.get<uint64_t>();
            if (u > static_cast<uint64_t>(INT64_MAX)) {
                return Value(static_cast<double>(u));
            }
            return Value(static_cast<int64_t>(u));
        }
        case json::value_t::number_float:
            return Value(j.get<double>());
        case json::value_t::string:
            return Value(j.get<std::string>());
        case json::value_t::binary:
            return Value::bytes(Bytes(j.get_binary().begin(), j.get_binary().end()));
        case json::value_t::array: {
            Array items;
            items.reserve(j.size());
            for (const auto& element : j) {
                items.push_back(value_from_json(element));
            }
            return Value(std::move(items));
        }
        case json::value_t::object: {
            Object fields;
            for (const auto& [key, element] : j.items()) {
                fields.emplace(key, value_from_json(element));
            }
            return Value(std::move(fields));
        }
        default:
            return Value();
    }
}

TransferResult transfer_value(const Value& value) {
    TransferResult result;

    std::string clone_error;
    auto cloned = structured_clone(value, &clone_error);
    if (cloned) {
        result.ok = true;
        result.method = TransferMethod::STRUCTURED_CLONE;
        result.value = std::move(*cloned);
        return result;
    }

    spdlog::debug("Structured clone failed ({}), trying JSON round trip", clone_error);

    std::string json_error;
    auto serialized = value_to_json(value, &json_error);
    if (!serialized) {
        result.error = clone_error + "; " + json_error;
        return result;
    }

    try {
        auto reparsed = json::parse(serialized->dump());
        result.ok = true;
        result.method = TransferMethod::JSON_ROUND_TRIP;
        result.value = value_from_json(reparsed);
    } catch (const json::exception& e) {
        result.error = clone_error + "; " + e.what();
    }

    return result;
}

} // namespace warden::runtime
