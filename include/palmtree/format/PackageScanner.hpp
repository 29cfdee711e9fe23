#pragma once

#include <optional>

#include "palmtree/format/Header.hpp"
#include "palmtree/format/PackageTraversal.hpp"
#include "palmtree/io/ByteReader.hpp"

namespace palmtree {

struct ScanResult {
    PackageTotals totals;
    std::optional<TruncationNotice> truncation;
};

/**
 * @brief Counting pass over a version 2/3 file.
 *
 * Determines how many samples and packages the file holds without allocating
 * anything, so the materializing pass can size its matrix up front. A
 * truncated tail is logged as a warning and reported in the result.
 */
class PackageScanner {
public:
    static ScanResult scan(io::ByteReader& reader, const Header& header, const PackageLayout& layout);
};

} // namespace palmtree
