#pragma once

#include "palmtree/format/Header.hpp"
#include "palmtree/io/ByteReader.hpp"

namespace palmtree {

/**
 * @brief Parses the run-data preamble.
 *
 * Expects the reader at offset 0. Fields are consumed in file order and gated
 * on version and kind exactly as the format defines them; on return the reader
 * sits at Header::pos_data_start.
 */
class HeaderReader {
public:
    /**
     * @throws LoadError UNSUPPORTED_VERSION for a version tag outside {1, 2, 3},
     *         IO_ERROR if the file ends inside the preamble. The error carries
     *         the header as parsed up to the failure.
     */
    static Header read(io::ByteReader& reader);

private:
    static void parse(io::ByteReader& reader, Header& header);
    static std::vector<std::string> split_column_names(const std::string& names);
};

} // namespace palmtree
