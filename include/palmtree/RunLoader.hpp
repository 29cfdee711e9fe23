#pragma once

#include <optional>
#include <string>

#include "palmtree/format/Header.hpp"
#include "palmtree/format/LoadError.hpp"
#include "palmtree/format/PackageTraversal.hpp"
#include "palmtree/matrix/DenseMatrix.hpp"

namespace palmtree {

// The two recordings written for every run.
enum class RunFile {
    SOURCE,     // .src, data as received by the source module
    PIPELINE    // .dat, pipeline input streams plus filter/application output
};

/**
 * @brief Everything a load produced.
 *
 * `data` is empty when only the header was requested, and for plugin files in
 * the version 2/3 format, which have no package layout. `truncation` is set
 * when the tail of the file held an incomplete package that was discarded.
 */
struct RunData {
    Header header;
    std::optional<SampleMatrix> data;
    std::optional<TruncationNotice> truncation;
};

/**
 * @brief Reads only the preamble of a run-data file.
 * @throws LoadError FILE_NOT_FOUND, IO_ERROR or UNSUPPORTED_VERSION.
 */
Header read_header(const std::string& path);

/**
 * @brief Reads a source (.src) or pipeline (.dat) run-data file.
 *
 * Version 1 files are decoded row by row. Version 2/3 files take two passes:
 * the first counts samples and packages (filling Header::package_totals), the
 * second, only when `with_data` is set, allocates the matrix and fills it.
 * With `with_data` false no sample matrix is ever allocated.
 *
 * Column 0 of the matrix is the sample-package id, column 1 the elapsed time
 * in milliseconds, column 2 the source input time when the header says it is
 * included; the remaining columns hold one value per stream.
 *
 * @throws LoadError for missing or unreadable files, unknown versions,
 *         malformed version 1 headers, and refused allocations. The error
 *         carries the header as far as it was parsed.
 */
RunData read(const std::string& path, bool with_data = true);

/**
 * @brief Path of one recording of a run.
 *
 * Accepts the path to any of the run's files, with or without extension, and
 * returns it with the extension of the requested recording.
 */
std::string resolve_run_file(const std::string& path, RunFile which);

} // namespace palmtree
