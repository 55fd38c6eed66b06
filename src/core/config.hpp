#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace kstatpp::core::config {

// Client-side settings, read from the environment after load_dotenv().
struct ClientConfig {
    std::string log_level = "info";     // KSTATPP_LOG_LEVEL
    std::string log_pattern;            // KSTATPP_LOG_PATTERN, empty = built-in pattern
};

// Directory of the running executable, empty if the platform can't say.
std::filesystem::path executable_dir();

// Load environment variables from a .env file (idempotent).
// Searched: cwd and the executable's directory, each with two parents.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Loads .env (once) and returns the resulting client settings.
ClientConfig load_client_config();

} // namespace kstatpp::core::config
