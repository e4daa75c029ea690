#include "runtime/ambient.hpp"
#include "runtime/capabilities.hpp"
#include <stdexcept>

namespace warden::runtime {

namespace {
thread_local PolicyCapabilities* t_capabilities = nullptr;
} // namespace

AmbientScope::AmbientScope(PolicyCapabilities* capabilities)
    : previous_(t_capabilities) {
    t_capabilities = capabilities;
}

AmbientScope::~AmbientScope() {
    t_capabilities = previous_;
}

namespace ambient {

Value eval(const std::string& source) {
    if (!t_capabilities) {
        throw std::logic_error("dynamic code evaluation is not available in this process");
    }
    throw t_capabilities->deny_dynamic_code("eval", source);
}

Function compile_function(const std::vector<std::string>& params, const std::string& body) {
    if (!t_capabilities) {
        throw std::logic_error("dynamic code evaluation is not available in this process");
    }

    std::string signature = "function(";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) signature += ", ";
        signature += params[i];
    }
    signature += ") { " + body + " }";
    throw t_capabilities->deny_dynamic_code("compile_function", signature);
}

bool in_sandbox() {
    return t_capabilities != nullptr;
}

} // namespace ambient

} // namespace warden::runtime
