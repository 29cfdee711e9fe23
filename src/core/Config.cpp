#include "palmtree/core/Config.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace palmtree {

namespace {

std::optional<std::string> read_env(const char* name) {
    const char* env = std::getenv(name);
    if (env && *env != '\0') {
        return std::string(env);
    }
    return std::nullopt;
}

LogLevel initial_log_level() {
    if (auto value = read_env("PALMTREE_LOG_LEVEL")) {
        if (auto level = parse_log_level(*value)) {
            return *level;
        }
    }
    return LogLevel::WARNINGS;
}

bool initial_memory_check() {
    if (auto value = read_env("PALMTREE_MEMORY_CHECK")) {
        return *value != "0";
    }
    return true;
}

std::atomic<uint32_t>& log_level_slot() {
    static std::atomic<uint32_t> slot{static_cast<uint32_t>(initial_log_level())};
    return slot;
}

std::atomic<bool>& memory_check_slot() {
    static std::atomic<bool> slot{initial_memory_check()};
    return slot;
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& value) {
    std::string s = value;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "silent" || s == "off" || s == "none") return LogLevel::SILENT;
    if (s == "error" || s == "errors") return LogLevel::ERRORS;
    if (s == "warning" || s == "warnings" || s == "warn") return LogLevel::WARNINGS;
    return std::nullopt;
}

void set_log_level(LogLevel level) {
    log_level_slot().store(static_cast<uint32_t>(level));
}

LogLevel get_log_level() {
    return static_cast<LogLevel>(log_level_slot().load());
}

void set_memory_check_enabled(bool enabled) {
    memory_check_slot().store(enabled);
}

bool is_memory_check_enabled() {
    return memory_check_slot().load();
}

uint64_t get_default_safety_margin() {
    auto value = read_env("PALMTREE_MEMORY_SAFETY_MARGIN_MB");
    if (!value) {
        return 0;
    }
    char* end = nullptr;
    const unsigned long long mb = std::strtoull(value->c_str(), &end, 10);
    if (end == value->c_str()) {
        return 0;
    }
    constexpr uint64_t bytes_per_mb = 1024 * 1024;
    if (mb > (std::numeric_limits<uint64_t>::max)() / bytes_per_mb) {
        return (std::numeric_limits<uint64_t>::max)();
    }
    return static_cast<uint64_t>(mb) * bytes_per_mb;
}

}
