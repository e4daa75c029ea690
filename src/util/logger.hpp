#pragma once
#include <spdlog/spdlog.h>

namespace warden::util {

// Install the colored console logger as spdlog's default. Safe to call twice.
void init_logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace warden::util
