#include "bindings_common.hpp"
#include "binding_warnings.hpp"

#include "palmtree/core/Config.hpp"
#include "palmtree/core/MemoryGuard.hpp"

void bind_loader(py::module_& m);

PYBIND11_MODULE(_palmtree, m) {
    m.doc() = "Palmtree: loader for Palmtree run data (.src / .dat)";

    py::object category = py::reinterpret_steal<py::object>(
        PyErr_NewException("_palmtree.PalmtreeWarning", PyExc_UserWarning, nullptr));
    m.attr("PalmtreeWarning") = category;
    palmtree::bindings_warn::set_warning_category(category);

    bind_loader(m);

    // --- Memory Guard ---
    py::class_<palmtree::core::MemoryGuard>(m, "MemoryGuard")
        .def_static("instance", &palmtree::core::MemoryGuard::instance, py::return_value_policy::reference)
        .def("get_total_system_ram", &palmtree::core::MemoryGuard::get_total_system_ram)
        .def("get_available_system_ram", &palmtree::core::MemoryGuard::get_available_system_ram)
        .def("get_safety_margin", &palmtree::core::MemoryGuard::get_safety_margin)
        .def("set_safety_margin", &palmtree::core::MemoryGuard::set_safety_margin)
        .def("can_fit_in_ram", &palmtree::core::MemoryGuard::can_fit_in_ram);

    m.def("set_memory_check_enabled", &palmtree::set_memory_check_enabled, py::arg("enabled"));
    m.def("is_memory_check_enabled", &palmtree::is_memory_check_enabled);
}
