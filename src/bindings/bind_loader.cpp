#include "bindings_common.hpp"
#include "binding_warnings.hpp"

#include "palmtree/RunLoader.hpp"
#include "palmtree/core/Log.hpp"

using namespace palmtree;

namespace {

py::tuple load_data(const std::string& path, bool read_data) {
    try {
        RunData run = palmtree::read(path, read_data);
        if (run.truncation) {
            bindings_warn::warn(run.truncation->reason);
        }
        py::dict header = bindings::header_to_dict(run.header);
        if (!run.data) {
            return py::make_tuple(header, py::none());
        }
        return py::make_tuple(header, bindings::matrix_to_numpy(std::move(*run.data)));
    } catch (const LoadError& e) {
        // As much header as was parsed, never a partial matrix.
        // Version and allocation failures were already reported where they happened.
        if (e.code() != ErrorCode::UNSUPPORTED_VERSION && e.code() != ErrorCode::ALLOCATION_FAILED) {
            core::log_error(e.what());
        }
        if (e.header() && e.code() != ErrorCode::IO_ERROR) {
            return py::make_tuple(bindings::header_to_dict(*e.header()), py::none());
        }
        return py::make_tuple(py::none(), py::none());
    }
}

} // namespace

void bind_loader(py::module_& m) {
    py::register_exception<LoadError>(m, "LoadError", PyExc_RuntimeError);

    m.def("read_header", [](const std::string& path) {
        return bindings::header_to_dict(palmtree::read_header(path));
    }, py::arg("path"),
       "Read only the header of a Palmtree run-data file (.src or .dat).");

    m.def("load_data", &load_data, py::arg("filepath"), py::arg("read_data") = true,
          "Read the header and, optionally, the sample matrix of a Palmtree run-data file.\n"
          "Returns (header, data); data is None when only the header was read or the load failed.");

    m.def("resolve_run_file", [](const std::string& path, bool source) {
        return palmtree::resolve_run_file(path, source ? RunFile::SOURCE : RunFile::PIPELINE);
    }, py::arg("path"), py::arg("source") = false);
}
