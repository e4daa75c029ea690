#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace warden::util {

void init_logger() {
    auto console = spdlog::get("warden");
    if (!console) {
        console = spdlog::stderr_color_mt("warden");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

} // namespace warden::util
