#include "runtime/value.hpp"
#include <stdexcept>
#include <sstream>
#include <set>
#include <unordered_set>
#include <utility>

namespace warden::runtime {

const char* value_type_to_string(ValueType type) {
    switch (type) {
        case ValueType::NUL:      return "null";
        case ValueType::BOOL:     return "bool";
        case ValueType::INT:      return "int";
        case ValueType::DOUBLE:   return "double";
        case ValueType::STRING:   return "string";
        case ValueType::BYTES:    return "bytes";
        case ValueType::ARRAY:    return "array";
        case ValueType::OBJECT:   return "object";
        case ValueType::FUNCTION: return "function";
        case ValueType::HOST:     return "host";
        default: return "unknown";
    }
}

// ============================================================================
// Construction
// ============================================================================

Value::Value(bool b) : type_(ValueType::BOOL), bool_(b) {}

Value::Value(int i) : type_(ValueType::INT), int_(i) {}

Value::Value(int64_t i) : type_(ValueType::INT), int_(i) {}

Value::Value(double d) : type_(ValueType::DOUBLE), double_(d) {}

Value::Value(const char* s) : type_(ValueType::STRING), string_(s ? s : "") {}

Value::Value(std::string s) : type_(ValueType::STRING), string_(std::move(s)) {}

Value::Value(Array items)
    : type_(ValueType::ARRAY)
    , array_(std::make_shared<Array>(std::move(items))) {}

Value::Value(Object fields)
    : type_(ValueType::OBJECT)
    , object_(std::make_shared<Object>(std::move(fields))) {}

Value Value::bytes(Bytes data) {
    Value v;
    v.type_ = ValueType::BYTES;
    v.bytes_ = std::make_shared<Bytes>(std::move(data));
    return v;
}

Value Value::function(Function fn) {
    Value v;
    v.type_ = ValueType::FUNCTION;
    v.function_ = std::make_shared<Function>(std::move(fn));
    return v;
}

Value Value::host(std::shared_ptr<HostObject> object) {
    if (!object) {
        return Value();
    }
    Value v;
    v.type_ = ValueType::HOST;
    v.host_ = std::move(object);
    return v;
}

Value Value::array() {
    return Value(Array{});
}

Value Value::object() {
    return Value(Object{});
}

// ============================================================================
// Accessors
// ============================================================================

void Value::expect(ValueType type) const {
    if (type_ != type) {
        throw std::runtime_error(std::string("value is ") + value_type_to_string(type_) +
                                 ", expected " + value_type_to_string(type));
    }
}

bool Value::as_bool() const {
    expect(ValueType::BOOL);
    return bool_;
}

int64_t Value::as_int() const {
    expect(ValueType::INT);
    return int_;
}

double Value::as_double() const {
    if (type_ == ValueType::INT) {
        return static_cast<double>(int_);
    }
    expect(ValueType::DOUBLE);
    return double_;
}

const std::string& Value::as_string() const {
    expect(ValueType::STRING);
    return string_;
}

const Bytes& Value::as_bytes() const {
    expect(ValueType::BYTES);
    return *bytes_;
}

Array& Value::as_array() const {
    expect(ValueType::ARRAY);
    return *array_;
}

Object& Value::as_object() const {
    expect(ValueType::OBJECT);
    return *object_;
}

const std::shared_ptr<HostObject>& Value::as_host() const {
    expect(ValueType::HOST);
    return host_;
}

Value Value::call(const std::vector<Value>& args) const {
    expect(ValueType::FUNCTION);
    return (*function_)(args);
}

void Value::push(Value item) const {
    as_array().push_back(std::move(item));
}

void Value::set(const std::string& key, Value item) const {
    as_object()[key] = std::move(item);
}

std::optional<Value> Value::get(const std::string& key) const {
    auto& fields = as_object();
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t Value::size() const {
    switch (type_) {
        case ValueType::STRING: return string_.size();
        case ValueType::BYTES:  return bytes_->size();
        case ValueType::ARRAY:  return array_->size();
        case ValueType::OBJECT: return object_->size();
        default: return 0;
    }
}

const void* Value::identity() const {
    switch (type_) {
        case ValueType::BYTES:    return bytes_.get();
        case ValueType::ARRAY:    return array_.get();
        case ValueType::OBJECT:   return object_.get();
        case ValueType::FUNCTION: return function_.get();
        case ValueType::HOST:     return host_.get();
        default: return nullptr;
    }
}

// ============================================================================
// Rendering and comparison
// ============================================================================

namespace {

std::string quoted(const std::string& s) {
    return nlohmann::json(s).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void render(const Value& value, std::ostringstream& out,
            std::unordered_set<const void*>& ancestors) {
    switch (value.type()) {
        case ValueType::NUL:    out << "null"; return;
        case ValueType::BOOL:   out << (value.as_bool() ? "true" : "false"); return;
        case ValueType::INT:    out << value.as_int(); return;
        case ValueType::DOUBLE: out << value.as_double(); return;
        case ValueType::STRING: out << quoted(value.as_string()); return;
        case ValueType::BYTES:  out << "<bytes:" << value.size() << ">"; return;
        case ValueType::FUNCTION: out << "<function>"; return;
        case ValueType::HOST:   out << "<host:" << value.as_host()->type_name() << ">"; return;
        default: break;
    }

    if (!ancestors.insert(value.identity()).second) {
        out << "<cycle>";
        return;
    }

    if (value.is_array()) {
        out << '[';
        bool first = true;
        for (const auto& item : value.as_array()) {
            if (!first) out << ',';
            first = false;
            render(item, out, ancestors);
        }
        out << ']';
    } else {
        out << '{';
        bool first = true;
        for (const auto& [key, item] : value.as_object()) {
            if (!first) out << ',';
            first = false;
            out << quoted(key) << ':';
            render(item, out, ancestors);
        }
        out << '}';
    }

    ancestors.erase(value.identity());
}

} // namespace

std::string Value::to_string() const {
    std::ostringstream out;
    std::unordered_set<const void*> ancestors;
    render(*this, out, ancestors);
    return out.str();
}

namespace {

// Container pairs already under comparison; meeting one again means a cycle
using ComparedPairs = std::set<std::pair<const void*, const void*>>;

bool equal_values(const Value& a, const Value& b, ComparedPairs& compared);

bool equal_containers(const Value& a, const Value& b, ComparedPairs& compared) {
    if (a.identity() == b.identity()) {
        return true;
    }
    if (!compared.insert({a.identity(), b.identity()}).second) {
        return true;
    }
    if (a.size() != b.size()) {
        return false;
    }

    if (a.is_array()) {
        const auto& left = a.as_array();
        const auto& right = b.as_array();
        for (size_t i = 0; i < left.size(); i++) {
            if (!equal_values(left[i], right[i], compared)) {
                return false;
            }
        }
        return true;
    }

    auto other = b.as_object().begin();
    for (const auto& [key, item] : a.as_object()) {
        if (key != other->first || !equal_values(item, other->second, compared)) {
            return false;
        }
        ++other;
    }
    return true;
}

bool equal_values(const Value& a, const Value& b, ComparedPairs& compared) {
    if (a.type() != b.type()) {
        return false;
    }
    if (a.is_array() || a.is_object()) {
        return equal_containers(a, b, compared);
    }
    return a == b;
}

} // namespace

bool Value::operator==(const Value& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case ValueType::NUL:    return true;
        case ValueType::BOOL:   return bool_ == other.bool_;
        case ValueType::INT:    return int_ == other.int_;
        case ValueType::DOUBLE: return double_ == other.double_;
        case ValueType::STRING: return string_ == other.string_;
        case ValueType::BYTES:  return *bytes_ == *other.bytes_;
        case ValueType::ARRAY:
        case ValueType::OBJECT: {
            ComparedPairs compared;
            return equal_containers(*this, other, compared);
        }
        case ValueType::FUNCTION: return function_ == other.function_;
        case ValueType::HOST:     return host_ == other.host_;
        default: return false;
    }
}

} // namespace warden::runtime
