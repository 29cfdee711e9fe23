#pragma once

#include "palmtree/format/Header.hpp"
#include "palmtree/io/ByteReader.hpp"
#include "palmtree/matrix/DenseMatrix.hpp"

namespace palmtree {

/**
 * @brief Decoder for version 1 files, where every row has the same byte width.
 *
 * Source and pipeline rows are a uint32 sample id followed by num_columns - 1
 * doubles; plugin rows are num_columns doubles. A trailing partial row is
 * dropped without a warning.
 */
class FixedRowDecoder {
public:
    /**
     * @brief Row size and count implied by the header and file size.
     * @throws LoadError MALFORMED_HEADER for a source/pipeline header without columns.
     */
    static FixedRowGeometry measure(const Header& header);

    /**
     * @brief Reads every complete row into a num_rows x num_columns matrix.
     *
     * Expects header.fixed_rows to have been filled by measure().
     * @throws LoadError ALLOCATION_FAILED when MemoryGuard refuses the matrix.
     */
    static SampleMatrix decode(io::ByteReader& reader, const Header& header);
};

} // namespace palmtree
