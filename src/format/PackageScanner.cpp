#include "palmtree/format/PackageScanner.hpp"
#include "palmtree/core/DebugTrace.hpp"
#include "palmtree/core/Log.hpp"

namespace palmtree {

namespace {

class CountingVisitor {
public:
    void begin_package(const PackageStamp&, uint64_t num_rows) {
        total_samples_ += num_rows;
        ++total_packages_;
    }

    // Values are skipped; the traversal seeks past them.
    void visit_block(uint32_t, uint32_t, uint32_t, io::ByteReader&) {}

    uint64_t total_samples() const { return total_samples_; }
    uint64_t total_packages() const { return total_packages_; }

private:
    uint64_t total_samples_ = 0;
    uint64_t total_packages_ = 0;
};

} // namespace

ScanResult PackageScanner::scan(io::ByteReader& reader, const Header& header, const PackageLayout& layout) {
    debug_trace::set_last(layout.chunked ? "v2.scan.chunked" : "v2.scan.flat");

    CountingVisitor visitor;
    const TraversalOutcome outcome = traverse_packages(reader, header, layout, visitor);

    ScanResult result;
    result.totals.total_samples = visitor.total_samples();
    result.totals.total_packages = visitor.total_packages();
    result.totals.max_samples_stream = header.max_samples_stream();
    result.truncation = outcome.truncation;

    if (result.truncation) {
        core::log_warning(result.truncation->reason);
    }
    return result;
}

} // namespace palmtree
