#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <nlohmann/json.hpp>
#include "audit/audit_log.hpp"
#include "policy/policy.hpp"
#include "runtime/ambient.hpp"
#include "runtime/capabilities.hpp"
#include "runtime/file_store.hpp"
#include "runtime/sandbox.hpp"
#include "util/logger.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using warden::runtime::Capabilities;
using warden::runtime::CapabilityError;
using warden::runtime::Value;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_RUN_FAILED = 1;
constexpr int EXIT_USAGE = 2;

enum class OpKind { READ, LIST, FETCH, ALLOC, EVAL, SLEEP, RETURN };

struct Op {
    OpKind kind;
    std::string name;
    std::string arg;
};

void print_usage() {
    fmt::print(stderr,
        "Usage: warden-probe <policy.json> [ops...]\n"
        "\n"
        "Operations run in order inside one sandboxed run:\n"
        "  --read PATH       Read a file through the capability API\n"
        "  --list PREFIX     List files under a prefix\n"
        "  --fetch URL       Fetch a URL (host must be allowlisted)\n"
        "  --alloc BYTES     Account an allocation against the soft limit\n"
        "  --eval SOURCE     Attempt dynamic code evaluation\n"
        "  --sleep MS        Block the sandboxed code for MS milliseconds\n"
        "  --return TEXT     Include TEXT in the run's return value\n"
        "  --root DIR        Serve files from DIR instead of the policy's virtual files\n"
        "  --verbose         Debug logging\n");
}

bool parse_op(const std::string& flag, const std::string& arg, Op& op) {
    static const std::vector<std::pair<std::string, OpKind>> flags = {
        {"--read", OpKind::READ},   {"--list", OpKind::LIST},   {"--fetch", OpKind::FETCH},
        {"--alloc", OpKind::ALLOC}, {"--eval", OpKind::EVAL},   {"--sleep", OpKind::SLEEP},
        {"--return", OpKind::RETURN},
    };

    for (const auto& [name, kind] : flags) {
        if (flag == name) {
            op = Op{kind, name.substr(2), arg};
            return true;
        }
    }
    return false;
}

// Execute one op; capability denials are reported in the entry, not rethrown
Value run_op(Capabilities& caps, const Op& op) {
    Value entry = Value::object();
    entry.set("op", op.name);
    entry.set("arg", op.arg);

    try {
        switch (op.kind) {
            case OpKind::READ:
                entry.set("result", caps.read_file(op.arg));
                break;
            case OpKind::LIST: {
                Value files = Value::array();
                for (const auto& path : caps.list_files(op.arg)) {
                    files.push(path);
                }
                entry.set("result", files);
                break;
            }
            case OpKind::FETCH: {
                auto response = caps.fetch(op.arg);
                Value result = Value::object();
                result.set("status", response.status);
                result.set("host", response.host);
                entry.set("result", result);
                break;
            }
            case OpKind::ALLOC:
                entry.set("result", static_cast<int64_t>(caps.alloc(std::stoull(op.arg))));
                break;
            case OpKind::EVAL:
                entry.set("result", warden::runtime::ambient::eval(op.arg));
                break;
            case OpKind::SLEEP:
                std::this_thread::sleep_for(std::chrono::milliseconds(std::stol(op.arg)));
                entry.set("result", nullptr);
                break;
            case OpKind::RETURN:
                entry.set("result", op.arg);
                break;
        }
        entry.set("ok", true);
    } catch (const CapabilityError& e) {
        entry.set("ok", false);
        entry.set("error", e.what());
    }

    return entry;
}

bool load_policy(const std::string& path, warden::policy::PolicyConfig& policy) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Cannot open policy file: {}", path);
        return false;
    }

    try {
        policy = warden::policy::PolicyConfig::from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid policy file {}: {}", path, e.what());
        return false;
    }

    if (auto problem = policy.validate()) {
        spdlog::error("Invalid policy {}: {}", path, *problem);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    warden::util::init_logger();

    if (argc < 2) {
        print_usage();
        return EXIT_USAGE;
    }

    std::string policy_path = argv[1];
    std::string root_dir;
    std::vector<Op> ops;

    for (int i = 2; i < argc; i++) {
        std::string flag = argv[i];
        if (flag == "--verbose") {
            warden::util::set_log_level(spdlog::level::debug);
            continue;
        }
        if (flag == "--help" || flag == "-h") {
            print_usage();
            return EXIT_USAGE;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Missing argument for {}\n", flag);
            print_usage();
            return EXIT_USAGE;
        }

        if (flag == "--root") {
            root_dir = argv[++i];
            continue;
        }

        Op op;
        if (!parse_op(flag, argv[i + 1], op)) {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            print_usage();
            return EXIT_USAGE;
        }
        if (op.kind == OpKind::ALLOC || op.kind == OpKind::SLEEP) {
            try {
                if (std::stoll(op.arg) < 0) {
                    throw std::out_of_range(op.arg);
                }
            } catch (const std::logic_error&) {
                fmt::print(stderr, "--{} expects a non-negative integer, got '{}'\n",
                    op.name, op.arg);
                return EXIT_USAGE;
            }
        }
        ops.push_back(std::move(op));
        i++;
    }

    warden::policy::PolicyConfig policy;
    if (!load_policy(policy_path, policy)) {
        return EXIT_USAGE;
    }

    warden::audit::AuditLogger audit_log;
    warden::runtime::SandboxOptions options;
    options.name = "probe";
    options.audit_callback = audit_log.as_callback("probe");
    if (!root_dir.empty()) {
        options.file_store = std::make_shared<warden::runtime::HostFileStore>(root_dir);
    }

    warden::runtime::Sandbox sandbox(policy, options);

    auto result = sandbox.run([ops](Capabilities& caps) {
        Value report = Value::object();
        Value entries = Value::array();
        for (const auto& op : ops) {
            entries.push(run_op(caps, op));
        }
        report.set("ops", entries);
        return report;
    });

    std::cout << result.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << "\n";
    std::string audit_lines = audit_log.export_jsonl();
    if (!audit_lines.empty()) {
        std::cout << audit_lines;
        if (audit_lines.back() != '\n') {
            std::cout << "\n";
        }
    }
    std::cout << std::flush;

    if (result.success) {
        fmt::print(stderr, fg(fmt::color::green) | fmt::emphasis::bold,
            "✓ run completed ({} violations)\n", result.violations.size());
        return EXIT_OK;
    }

    fmt::print(stderr, fg(fmt::color::red) | fmt::emphasis::bold,
        "✗ run failed: {}\n", result.error ? result.error->message : "unknown error");
    return EXIT_RUN_FAILED;
}
