/**
 * Warden Value
 *
 * Dynamic value returned by sandboxed code. Arrays and objects are shared
 * by reference (copying a Value aliases the container), so graphs and
 * cycles can be built; functions and host handles are live objects that
 * do not cross the isolation boundary.
 */
#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace warden::runtime {

class Value;

using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;
using Bytes = std::vector<uint8_t>;
using Function = std::function<Value(const std::vector<Value>&)>;

// Opaque host resource (file handle, socket, lock...) exposed to sandboxed code
class HostObject {
public:
    virtual ~HostObject() = default;

    virtual std::string type_name() const = 0;

    // JSON form used by the serialize round trip; nullopt = not serializable
    virtual std::optional<nlohmann::json> to_json() const { return std::nullopt; }
};

enum class ValueType {
    NUL,
    BOOL,
    INT,
    DOUBLE,
    STRING,
    BYTES,
    ARRAY,
    OBJECT,
    FUNCTION,
    HOST
};

const char* value_type_to_string(ValueType type);

class Value {
public:
    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b);
    Value(int i);
    Value(int64_t i);
    Value(double d);
    Value(const char* s);
    Value(std::string s);
    Value(Array items);
    Value(Object fields);

    static Value bytes(Bytes data);
    static Value function(Function fn);
    static Value host(std::shared_ptr<HostObject> object);

    // Fresh empty containers
    static Value array();
    static Value object();

    ValueType type() const { return type_; }
    bool is_null() const { return type_ == ValueType::NUL; }
    bool is_array() const { return type_ == ValueType::ARRAY; }
    bool is_object() const { return type_ == ValueType::OBJECT; }

    // Typed accessors (throw std::runtime_error on type mismatch)
    bool as_bool() const;
    int64_t as_int() const;
    double as_double() const;
    const std::string& as_string() const;
    const Bytes& as_bytes() const;
    Array& as_array() const;
    Object& as_object() const;
    const std::shared_ptr<HostObject>& as_host() const;

    // Call a function value
    Value call(const std::vector<Value>& args = {}) const;

    // Container helpers
    void push(Value item) const;
    void set(const std::string& key, Value item) const;
    std::optional<Value> get(const std::string& key) const;
    size_t size() const;

    // Identity of the shared container, for cycle detection
    const void* identity() const;

    // Human-readable rendering (cycles shown as "<cycle>")
    std::string to_string() const;

    // Structural equality; containers compared element-wise, cycles tolerated
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    ValueType type_ = ValueType::NUL;
    bool bool_ = false;
    int64_t int_ = 0;
    double double_ = 0.0;
    std::string string_;
    std::shared_ptr<Bytes> bytes_;
    std::shared_ptr<Array> array_;
    std::shared_ptr<Object> object_;
    std::shared_ptr<Function> function_;
    std::shared_ptr<HostObject> host_;

    void expect(ValueType type) const;
};

} // namespace warden::runtime
