#pragma once

#include "bindings_common.hpp"

#include <string>

namespace palmtree::bindings_warn {

// Registers the module's warning category. Called once from module init; the
// reference is kept for the lifetime of the interpreter.
void set_warning_category(py::handle category);

// Emit a warning with Palmtree's warning category when registered,
// falling back to UserWarning.
void warn(const std::string& message, int stacklevel = 2);

} // namespace palmtree::bindings_warn
