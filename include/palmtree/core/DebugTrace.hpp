#pragma once

#include <string>

namespace palmtree::debug_trace {

// Test-only hook used to verify which decode path a load took.
// Stored as a thread_local string so concurrent loads don't clobber each other.
void set_last(const char* value);
void clear();
std::string get_last();

// Separate warning channel so a logged warning doesn't clobber the decode trace.
void set_last_warning(const std::string& value);
void clear_warning();
std::string get_last_warning();

} // namespace palmtree::debug_trace
