/**
 * Warden Ambient Guards
 *
 * Stand-ins for dynamic code evaluation (evaluate a string, build a
 * function from source). Inside a sandbox worker every call records a
 * DYNAMIC_CODE violation and throws CapabilityError; elsewhere they throw
 * std::logic_error because the host embeds no evaluator.
 */
#pragma once
#include <string>
#include <vector>
#include "runtime/value.hpp"

namespace warden::runtime {

class PolicyCapabilities;

namespace ambient {

Value eval(const std::string& source);

Function compile_function(const std::vector<std::string>& params, const std::string& body);

// True on a thread currently running sandboxed code
bool in_sandbox();

} // namespace ambient

// Binds the guards on the current thread to a capability set for its lifetime
class AmbientScope {
public:
    explicit AmbientScope(PolicyCapabilities* capabilities);
    ~AmbientScope();

    AmbientScope(const AmbientScope&) = delete;
    AmbientScope& operator=(const AmbientScope&) = delete;

private:
    PolicyCapabilities* previous_;
};

} // namespace warden::runtime
