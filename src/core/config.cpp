#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <limits.h>
#include <optional>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace kstatpp::core::config {

namespace {

std::string trim(const std::string& s, const char* blanks = " \t\r\n") {
    size_t start = s.find_first_not_of(blanks);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(blanks);
    return s.substr(start, end - start + 1);
}

// Strip one layer of matching single or double quotes.
std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        char q = value.front();
        if ((q == '"' || q == '\'') && value.back() == q) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

// KEY=VALUE, blank lines and '#' comments skipped
std::optional<std::pair<std::string, std::string>> parse_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return std::nullopt;

    size_t eq = line.find('=');
    if (eq == std::string::npos) return std::nullopt;

    std::string key = trim(line.substr(0, eq));
    if (key.empty()) return std::nullopt;
    return std::make_pair(key, unquote(trim(line.substr(eq + 1))));
}

// cwd and executable dir, each with two parents, de-duplicated in order.
std::vector<std::filesystem::path> search_roots() {
    std::vector<std::filesystem::path> bases;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) bases.push_back(cwd);
    auto exe = executable_dir();
    if (!exe.empty()) bases.push_back(exe);

    std::vector<std::filesystem::path> roots;
    for (auto p : bases) {
        for (int depth = 0; depth < 3 && !p.empty(); ++depth) {
            bool seen = false;
            for (const auto& r : roots) {
                if (r == p) {
                    seen = true;
                    break;
                }
            }
            if (!seen) roots.push_back(p);
            p = p.parent_path();
        }
    }
    return roots;
}

} // namespace

// Linux links /proc/self/exe, illumos and Solaris /proc/self/path/a.out.
std::filesystem::path executable_dir() {
    for (const char* link : {"/proc/self/exe", "/proc/self/path/a.out"}) {
        char buf[PATH_MAX];
        ssize_t len = readlink(link, buf, sizeof(buf) - 1);
        if (len <= 0) continue;
        buf[len] = '\0';
        return std::filesystem::path(buf).parent_path();
    }
    return {};
}

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    auto roots = search_roots();
    roots.insert(roots.end(), extra_search_paths.begin(), extra_search_paths.end());

    for (const auto& base : roots) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(env_path, ec)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        while (std::getline(file, line)) {
            auto kv = parse_line(line);
            if (!kv) continue;
            // Variables already in the environment win.
            setenv(kv->first.c_str(), kv->second.c_str(), 0);
        }
        break;
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

ClientConfig load_client_config() {
    load_dotenv();

    ClientConfig cfg;
    cfg.log_level = get_env_or("KSTATPP_LOG_LEVEL", cfg.log_level);
    cfg.log_pattern = get_env("KSTATPP_LOG_PATTERN");
    return cfg;
}

} // namespace kstatpp::core::config
