#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "palmtree/core/Types.hpp"

namespace palmtree {

// Per-stream layout declared in version 2/3 preambles.
struct StreamInfo {
    uint8_t data_type = 0;
    uint16_t samples_per_package = 0;
};

struct RunEpochs {
    uint64_t run_start_epoch = 0;
    uint64_t file_start_epoch = 0;
};

// Version 1 geometry, derived from the file size.
struct FixedRowGeometry {
    uint64_t row_size = 0;
    uint64_t num_rows = 0;
};

// Version 2/3 totals, derived by the counting pass.
struct PackageTotals {
    uint64_t total_samples = 0;
    uint64_t total_packages = 0;
    uint16_t max_samples_stream = 0;
};

/**
 * @brief Layout description of a run-data file.
 *
 * Filled in the order the preamble is consumed. Every group that only exists
 * for some versions or kinds is an optional and stays empty unless its gating
 * condition holds, so "absent" never collapses into "zero".
 */
struct Header {
    uint64_t file_size = 0;
    uint32_t version = 0;
    std::string code;

    std::optional<RunEpochs> epochs;                  // version >= 2
    std::optional<bool> includes_source_input_time;   // source kind, version 3

    double sample_rate = 0.0;
    uint32_t num_playback_streams = 0;

    std::optional<std::vector<StreamInfo>> streams;   // version >= 2

    uint32_t num_columns = 0;
    uint32_t column_names_size = 0;
    std::vector<std::string> column_names;

    uint64_t pos_data_start = 0;

    // True once the whole preamble has been parsed.
    bool complete = false;

    std::optional<FixedRowGeometry> fixed_rows;
    std::optional<PackageTotals> package_totals;

    FileKind kind() const;

    // Number of declared streams; 0 for version 1 files.
    uint32_t num_streams() const;

    // Largest declared samples-per-package across streams; 0 without streams.
    uint16_t max_samples_stream() const;

    // Pipeline packages are split into chunks when any stream logs more than one sample per package.
    bool uses_chunked_packages() const;

    bool has_source_input_time() const;

    // Leading id/elapsed(/input-time) columns in a version 2/3 sample matrix.
    uint32_t header_columns() const;
};

FileKind file_kind_from_code(const std::string& code);

} // namespace palmtree
