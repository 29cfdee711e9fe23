#include "palmtree/format/PackageTraversal.hpp"

namespace palmtree {

std::optional<PackageLayout> make_package_layout(const Header& header) {
    PackageLayout layout;
    layout.kind = header.kind();
    layout.num_streams = header.num_streams();

    switch (layout.kind) {
        case FileKind::SOURCE:
            // id <uint32> + elapsed <double> [+ source-input-time <double>] + #samples <uint16>
            layout.includes_input_time = header.has_source_input_time();
            layout.package_header_size = layout.includes_input_time ? 22 : 14;
            layout.header_columns = layout.includes_input_time ? 3 : 2;
            return layout;
        case FileKind::PIPELINE:
            // id <uint32> + elapsed <double>
            layout.package_header_size = 12;
            layout.header_columns = 2;
            layout.chunked = header.uses_chunked_packages();
            return layout;
        default:
            return std::nullopt;
    }
}

} // namespace palmtree
