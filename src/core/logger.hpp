#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace kstatpp::core {

// Initialize logging with console output (level and pattern from config)
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name; unknown names map to info
spdlog::level::level_enum log_level_from_string(const std::string& name);

} // namespace kstatpp::core
