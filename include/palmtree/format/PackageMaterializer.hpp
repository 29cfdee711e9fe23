#pragma once

#include "palmtree/format/Header.hpp"
#include "palmtree/format/PackageTraversal.hpp"
#include "palmtree/io/ByteReader.hpp"
#include "palmtree/matrix/DenseMatrix.hpp"

namespace palmtree {

/**
 * @brief Materializing pass over a version 2/3 file.
 *
 * Allocates total_samples x (header_columns + num_streams) doubles, NaN-filled,
 * and repeats the counting pass's walk while writing each package into it.
 * Cells of chunks narrower than their package's widest chunk stay NaN.
 */
class PackageMaterializer {
public:
    /**
     * @param totals Counts produced by PackageScanner for the same file.
     * @throws LoadError ALLOCATION_FAILED when MemoryGuard refuses the matrix,
     *         IO_ERROR if the file no longer matches the counting pass.
     */
    static SampleMatrix materialize(io::ByteReader& reader,
                                    const Header& header,
                                    const PackageLayout& layout,
                                    const PackageTotals& totals);
};

} // namespace palmtree
