#include "palmtree/format/FixedRowDecoder.hpp"
#include "palmtree/format/LoadError.hpp"
#include "palmtree/core/DebugTrace.hpp"
#include "palmtree/core/MemoryGuard.hpp"

#include <limits>

namespace palmtree {

FixedRowGeometry FixedRowDecoder::measure(const Header& header) {
    FixedRowGeometry geometry;
    const uint64_t num_columns = header.num_columns;

    if (header.kind() == FileKind::PLUGIN) {
        geometry.row_size = num_columns * 8;
    } else {
        if (num_columns == 0) {
            throw LoadError(ErrorCode::MALFORMED_HEADER,
                            "Version 1 " + std::string(to_string(header.kind())) + " data declares no columns");
        }
        geometry.row_size = 4 + (num_columns - 1) * 8;
    }

    if (geometry.row_size > 0 && header.file_size > header.pos_data_start) {
        geometry.num_rows = (header.file_size - header.pos_data_start) / geometry.row_size;
    }
    return geometry;
}

SampleMatrix FixedRowDecoder::decode(io::ByteReader& reader, const Header& header) {
    const FixedRowGeometry geometry = header.fixed_rows ? *header.fixed_rows : measure(header);
    const uint64_t num_columns = header.num_columns;

    auto alloc = core::MemoryGuard::instance().allocate<double>(
        geometry.num_rows, num_columns, std::numeric_limits<double>::quiet_NaN());
    if (!alloc.ok()) {
        throw LoadError(ErrorCode::ALLOCATION_FAILED, "Could not allocate the version 1 sample matrix", header);
    }
    SampleMatrix data = std::move(*alloc.matrix);

    debug_trace::set_last("v1.fixed_rows");
    reader.seek(header.pos_data_start);

    const bool plugin = header.kind() == FileKind::PLUGIN;
    for (uint64_t i = 0; i < geometry.num_rows; ++i) {
        double* row = data.row(i);
        if (plugin) {
            reader.read_f64_array(row, num_columns);
        } else {
            row[0] = static_cast<double>(reader.read_u32());
            reader.read_f64_array(row + 1, num_columns - 1);
        }
    }
    return data;
}

} // namespace palmtree
