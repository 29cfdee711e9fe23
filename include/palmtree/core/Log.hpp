#pragma once

#include <string>

namespace palmtree::core {

// Writes "[Palmtree] Warning: ..." to stderr when the log level allows it.
// The message is always mirrored into debug_trace's warning channel.
void log_warning(const std::string& message);

// Writes "[Palmtree] Error: ..." to stderr unless logging is silenced.
void log_error(const std::string& message);

} // namespace palmtree::core
