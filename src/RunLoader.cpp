#include "palmtree/RunLoader.hpp"
#include "palmtree/core/Log.hpp"
#include "palmtree/format/FixedRowDecoder.hpp"
#include "palmtree/format/HeaderReader.hpp"
#include "palmtree/format/PackageMaterializer.hpp"
#include "palmtree/format/PackageScanner.hpp"
#include "palmtree/io/ByteReader.hpp"

#include <filesystem>

namespace palmtree {

namespace {

void read_body(io::ByteReader& reader, RunData& result, bool with_data) {
    Header& header = result.header;

    if (header.version == 1) {
        header.fixed_rows = FixedRowDecoder::measure(header);
        if (with_data) {
            result.data.emplace(FixedRowDecoder::decode(reader, header));
        }
        return;
    }

    const auto layout = make_package_layout(header);
    if (!layout) {
        core::log_error("Could not determine package header size for code '" + header.code + "', not reading data");
        return;
    }

    // Pass 1 establishes the totals so pass 2 can allocate the whole matrix at once.
    ScanResult scan = PackageScanner::scan(reader, header, *layout);
    header.package_totals = scan.totals;
    result.truncation = std::move(scan.truncation);

    if (with_data) {
        result.data.emplace(PackageMaterializer::materialize(reader, header, *layout, *header.package_totals));
    }
}

} // namespace

Header read_header(const std::string& path) {
    io::ByteReader reader(path);
    return HeaderReader::read(reader);
}

RunData read(const std::string& path, bool with_data) {
    io::ByteReader reader(path);

    RunData result;
    result.header = HeaderReader::read(reader);
    try {
        read_body(reader, result, with_data);
    } catch (LoadError& e) {
        e.attach_header(result.header);
        throw;
    }
    return result;
}

std::string resolve_run_file(const std::string& path, RunFile which) {
    std::filesystem::path p(path);
    p.replace_extension(which == RunFile::SOURCE ? ".src" : ".dat");
    return p.string();
}

} // namespace palmtree
