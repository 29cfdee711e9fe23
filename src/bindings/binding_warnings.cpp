#include "binding_warnings.hpp"

namespace palmtree::bindings_warn {

namespace {

PyObject* g_category = nullptr;

py::object resolve_warning_category() {
    if (g_category) {
        return py::reinterpret_borrow<py::object>(g_category);
    }
    return py::module_::import("builtins").attr("UserWarning");
}

} // namespace

void set_warning_category(py::handle category) {
    category.inc_ref();
    g_category = category.ptr();
}

void warn(const std::string& message, int stacklevel) {
    py::module_ warnings = py::module_::import("warnings");
    warnings.attr("warn")(py::str(message), resolve_warning_category(), stacklevel);
}

} // namespace palmtree::bindings_warn
