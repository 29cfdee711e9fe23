#include "palmtree/format/PackageMaterializer.hpp"
#include "palmtree/format/LoadError.hpp"
#include "palmtree/core/DebugTrace.hpp"
#include "palmtree/core/MemoryGuard.hpp"

#include <limits>

namespace palmtree {

namespace {

class MatrixWriter {
public:
    MatrixWriter(SampleMatrix& data, const PackageLayout& layout)
        : data_(data), layout_(layout) {}

    void begin_package(const PackageStamp& stamp, uint64_t num_rows) {
        if (next_row_ + num_rows > data_.rows()) {
            throw LoadError(ErrorCode::IO_ERROR, "Run file changed between the counting and the reading pass");
        }
        package_row_ = next_row_;
        next_row_ += num_rows;

        data_.fill_column(0, package_row_, next_row_, static_cast<double>(stamp.id));
        data_.fill_column(1, package_row_, next_row_, stamp.elapsed);
        if (layout_.includes_input_time) {
            data_.fill_column(2, package_row_, next_row_, stamp.source_input_time);
        }
    }

    void visit_block(uint32_t first_stream, uint32_t num_streams, uint32_t num_samples, io::ByteReader& reader) {
        if (num_streams == 0 || num_samples == 0) {
            return;
        }
        const uint64_t col = static_cast<uint64_t>(layout_.header_columns) + first_stream;
        if (col + num_streams > data_.cols() || package_row_ + num_samples > next_row_) {
            throw LoadError(ErrorCode::IO_ERROR, "Sample-chunk exceeds the matrix reserved by the counting pass");
        }
        // Sample-major block: each sample's stream values are contiguous, as is the row slice.
        for (uint32_t s = 0; s < num_samples; ++s) {
            reader.read_f64_array(data_.row(package_row_ + s) + col, num_streams);
        }
    }

    uint64_t rows_written() const { return next_row_; }

private:
    SampleMatrix& data_;
    const PackageLayout& layout_;
    uint64_t package_row_ = 0;
    uint64_t next_row_ = 0;
};

} // namespace

SampleMatrix PackageMaterializer::materialize(io::ByteReader& reader,
                                              const Header& header,
                                              const PackageLayout& layout,
                                              const PackageTotals& totals) {
    const uint64_t cols = static_cast<uint64_t>(layout.header_columns) + layout.num_streams;

    auto alloc = core::MemoryGuard::instance().allocate<double>(
        totals.total_samples, cols, std::numeric_limits<double>::quiet_NaN());
    if (!alloc.ok()) {
        throw LoadError(ErrorCode::ALLOCATION_FAILED, "Could not allocate the sample matrix", header);
    }
    SampleMatrix data = std::move(*alloc.matrix);

    debug_trace::set_last(layout.chunked ? "v2.read.chunked" : "v2.read.flat");

    MatrixWriter writer(data, layout);
    traverse_packages(reader, header, layout, writer);

    if (writer.rows_written() != totals.total_samples) {
        throw LoadError(ErrorCode::IO_ERROR, "Run file changed between the counting and the reading pass");
    }
    return data;
}

} // namespace palmtree
