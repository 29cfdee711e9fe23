#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "palmtree/core/Types.hpp"

namespace palmtree {

// --- Process-wide settings ---
// Each value is seeded once from the environment and can be overridden at runtime.
//
//   PALMTREE_LOG_LEVEL                 silent | error | warning (default: warning)
//   PALMTREE_MEMORY_CHECK              0 disables the free-RAM preflight (default: 1)
//   PALMTREE_MEMORY_SAFETY_MARGIN_MB   RAM kept free for the OS on every allocation (default: 0)

void set_log_level(LogLevel level);
LogLevel get_log_level();

void set_memory_check_enabled(bool enabled);
bool is_memory_check_enabled();

uint64_t get_default_safety_margin();

// Parses a PALMTREE_LOG_LEVEL value; nullopt for anything unrecognised.
std::optional<LogLevel> parse_log_level(const std::string& value);

}
