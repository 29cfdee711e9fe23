#include "palmtree/core/Log.hpp"
#include "palmtree/core/Config.hpp"
#include "palmtree/core/DebugTrace.hpp"

#include <iostream>

namespace palmtree::core {

void log_warning(const std::string& message) {
    debug_trace::set_last_warning(message);
    if (get_log_level() >= LogLevel::WARNINGS) {
        std::cerr << "[Palmtree] Warning: " << message << std::endl;
    }
}

void log_error(const std::string& message) {
    if (get_log_level() >= LogLevel::ERRORS) {
        std::cerr << "[Palmtree] Error: " << message << std::endl;
    }
}

} // namespace palmtree::core
