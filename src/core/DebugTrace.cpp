#include "palmtree/core/DebugTrace.hpp"

namespace palmtree::debug_trace {

thread_local std::string g_last;
thread_local std::string g_last_warning;

void set_last(const char* value) {
    g_last = value ? value : "";
}

void clear() {
    g_last.clear();
}

std::string get_last() {
    return g_last;
}

void set_last_warning(const std::string& value) {
    g_last_warning = value;
}

void clear_warning() {
    g_last_warning.clear();
}

std::string get_last_warning() {
    return g_last_warning;
}

} // namespace palmtree::debug_trace
