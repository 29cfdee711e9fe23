#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "palmtree/format/Header.hpp"
#include "palmtree/io/ByteReader.hpp"

namespace palmtree {

/**
 * @brief Byte layout of the packages in a version 2/3 file.
 */
struct PackageLayout {
    FileKind kind = FileKind::SOURCE;
    bool includes_input_time = false;
    bool chunked = false;
    uint32_t num_streams = 0;
    uint64_t package_header_size = 0;
    uint32_t header_columns = 2;
};

// Returns nullopt for plugin files, which have no package layout.
std::optional<PackageLayout> make_package_layout(const Header& header);

// Per-package values broadcast to every row the package occupies.
struct PackageStamp {
    uint32_t id = 0;
    double elapsed = 0.0;
    double source_input_time = 0.0;   // only meaningful with PackageLayout::includes_input_time
};

// Describes where a traversal stopped early because the tail of the file was incomplete.
struct TruncationNotice {
    uint64_t offset = 0;   // file offset of the discarded package
    std::string reason;
};

struct TraversalOutcome {
    uint64_t packages = 0;
    uint64_t rows = 0;
    std::optional<TruncationNotice> truncation;
};

namespace detail {

struct ChunkExtent {
    uint32_t first_stream = 0;
    uint32_t num_streams = 0;
    uint32_t num_samples = 0;
    uint64_t value_offset = 0;
};

inline TraversalOutcome& stop_truncated(TraversalOutcome& outcome, uint64_t offset, const char* reason) {
    outcome.truncation = TruncationNotice{offset, reason};
    return outcome;
}

} // namespace detail

/**
 * @brief Walks every complete package from Header::pos_data_start.
 *
 * The counting and the materializing pass both run through this one function,
 * so their byte-offset walks are identical by construction. A package is handed
 * to the visitor only after it is known to be complete; an incomplete package
 * at the tail ends the walk with a TruncationNotice instead of an error.
 *
 * Visitor interface:
 *   void begin_package(const PackageStamp& stamp, uint64_t num_rows);
 *   void visit_block(uint32_t first_stream, uint32_t num_streams,
 *                    uint32_t num_samples, io::ByteReader& reader);
 *
 * visit_block receives the reader positioned at a sample-major block of
 * num_samples x num_streams doubles. It may consume the block or leave it;
 * the traversal re-seeks past the block either way.
 */
template <typename Visitor>
TraversalOutcome traverse_packages(io::ByteReader& reader,
                                   const Header& header,
                                   const PackageLayout& layout,
                                   Visitor& visitor) {
    TraversalOutcome outcome;
    std::vector<detail::ChunkExtent> chunks;

    // The cursor is shared between passes; never assume where the previous one left it.
    reader.seek(header.pos_data_start);

    while (reader.fits(layout.package_header_size)) {
        const uint64_t package_offset = reader.tell();

        PackageStamp stamp;
        stamp.id = reader.read_u32();
        stamp.elapsed = reader.read_f64();
        if (layout.includes_input_time) {
            stamp.source_input_time = reader.read_f64();
        }

        if (layout.chunked) {
            chunks.clear();
            uint64_t stream_index = 0;
            uint32_t package_rows = 0;

            while (stream_index < layout.num_streams && reader.fits(4)) {
                detail::ChunkExtent chunk;
                chunk.first_stream = static_cast<uint32_t>(stream_index);
                chunk.num_streams = reader.read_u16();
                chunk.num_samples = reader.read_u16();
                chunk.value_offset = reader.tell();

                const uint64_t value_bytes = static_cast<uint64_t>(chunk.num_streams) * chunk.num_samples * 8;
                if (!reader.fits(value_bytes)) {
                    return detail::stop_truncated(outcome, package_offset,
                        "Not all values in the last sample-chunk are written, discarding last sample-chunk "
                        "and therefore sample-package. Stop reading.");
                }
                reader.skip(value_bytes);

                chunks.push_back(chunk);
                stream_index += chunk.num_streams;

                // Chunks may differ in sample count; the package spans its widest chunk.
                // A chunk without streams contributes no values and so no rows.
                if (chunk.num_streams > 0) {
                    package_rows = std::max(package_rows, chunk.num_samples);
                }
            }

            if (stream_index != layout.num_streams) {
                return detail::stop_truncated(outcome, package_offset,
                    "Not all streams in the last sample-package are written, discarding last sample-package. "
                    "Stop reading.");
            }

            const uint64_t package_end = reader.tell();
            visitor.begin_package(stamp, package_rows);
            for (const auto& chunk : chunks) {
                reader.seek(chunk.value_offset);
                visitor.visit_block(chunk.first_stream, chunk.num_streams, chunk.num_samples, reader);
            }
            reader.seek(package_end);

            outcome.rows += package_rows;
        } else {
            // Source packages state their sample count; flat pipeline packages hold one sample.
            const uint32_t num_samples = layout.kind == FileKind::SOURCE ? reader.read_u16() : 1;
            const uint64_t value_bytes = static_cast<uint64_t>(layout.num_streams) * num_samples * 8;

            if (!reader.fits(value_bytes)) {
                return detail::stop_truncated(outcome, package_offset,
                    "Not all values in the last sample-package are written, discarding last sample-package. "
                    "Stop reading.");
            }

            const uint64_t value_offset = reader.tell();
            visitor.begin_package(stamp, num_samples);
            visitor.visit_block(0, layout.num_streams, num_samples, reader);
            reader.seek(value_offset + value_bytes);

            outcome.rows += num_samples;
        }

        ++outcome.packages;
    }

    return outcome;
}

} // namespace palmtree
