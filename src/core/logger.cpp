#include "core/logger.hpp"
#include "core/config.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace kstatpp::core {

namespace {
const char* DEFAULT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
}

void init_logger() {
    auto cfg = config::load_client_config();

    auto logger = spdlog::get("kstatpp");
    if (!logger) {
        logger = spdlog::stdout_color_mt("kstatpp");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(cfg.log_pattern.empty() ? DEFAULT_PATTERN : cfg.log_pattern);
    set_log_level(log_level_from_string(cfg.log_level));
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace kstatpp::core
