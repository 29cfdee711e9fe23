#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

namespace py = pybind11;

#include "palmtree/format/Header.hpp"
#include "palmtree/matrix/DenseMatrix.hpp"

namespace palmtree::bindings {

// One key per header field. Gated fields are only
// emitted when present, so `'includes_source_input_time' in header` is meaningful.
inline py::dict header_to_dict(const Header& header) {
    py::dict d;
    d["file_size"] = header.file_size;
    d["version"] = header.version;
    if (!header.code.empty()) {
        d["code"] = header.code;
    }
    if (header.epochs) {
        d["run_start_epoch"] = header.epochs->run_start_epoch;
        d["file_start_epoch"] = header.epochs->file_start_epoch;
    }
    if (header.includes_source_input_time) {
        d["includes_source_input_time"] = *header.includes_source_input_time;
    }
    if (!header.complete) {
        return d;
    }

    d["sample_rate"] = header.sample_rate;
    d["num_playback_streams"] = header.num_playback_streams;
    if (header.streams) {
        py::list data_types;
        py::list samples_per_package;
        for (const auto& s : *header.streams) {
            data_types.append(static_cast<int>(s.data_type));
            samples_per_package.append(static_cast<int>(s.samples_per_package));
        }
        d["num_streams"] = header.num_streams();
        d["stream_data_types"] = data_types;
        d["stream_samples_per_package"] = samples_per_package;
    }
    d["num_columns"] = header.num_columns;
    d["column_names_size"] = header.column_names_size;
    d["column_names"] = header.column_names;
    d["pos_data_start"] = header.pos_data_start;

    if (header.fixed_rows) {
        d["row_size"] = header.fixed_rows->row_size;
        d["num_rows"] = header.fixed_rows->num_rows;
    }
    if (header.package_totals) {
        d["total_samples"] = header.package_totals->total_samples;
        d["total_packages"] = header.package_totals->total_packages;
        d["max_samples_stream"] = header.package_totals->max_samples_stream;
    }
    return d;
}

// Hands the matrix to NumPy without copying; the array's base capsule owns it.
inline py::array_t<double> matrix_to_numpy(SampleMatrix&& matrix) {
    auto owned = std::make_unique<SampleMatrix>(std::move(matrix));
    SampleMatrix* raw = owned.get();
    py::capsule owner(raw, [](void* p) { delete static_cast<SampleMatrix*>(p); });
    owned.release();

    const auto rows = static_cast<py::ssize_t>(raw->rows());
    const auto cols = static_cast<py::ssize_t>(raw->cols());
    return py::array_t<double>(
        {rows, cols},
        {static_cast<py::ssize_t>(sizeof(double)) * cols, static_cast<py::ssize_t>(sizeof(double))},
        raw->data(),
        owner);
}

} // namespace palmtree::bindings
