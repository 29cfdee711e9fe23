#include "palmtree/format/HeaderReader.hpp"
#include "palmtree/format/LoadError.hpp"
#include "palmtree/core/Log.hpp"

namespace palmtree {

Header HeaderReader::read(io::ByteReader& reader) {
    Header header;
    header.file_size = reader.file_size();
    try {
        parse(reader, header);
    } catch (LoadError& e) {
        e.attach_header(header);
        throw;
    }
    return header;
}

void HeaderReader::parse(io::ByteReader& reader, Header& header) {
    header.version = reader.read_u32();
    if (header.version < 1 || header.version > 3) {
        const std::string msg = "Unknown data version " + std::to_string(header.version);
        core::log_error(msg);
        throw LoadError(ErrorCode::UNSUPPORTED_VERSION, msg);
    }

    header.code = reader.read_ascii(3);
    const bool v2_layout = header.version >= 2;

    if (v2_layout) {
        RunEpochs epochs;
        epochs.run_start_epoch = reader.read_u64();
        epochs.file_start_epoch = reader.read_u64();
        header.epochs = epochs;
    }

    // Only source files of version 3 carry the input-time flag.
    if (header.kind() == FileKind::SOURCE && header.version == 3) {
        header.includes_source_input_time = reader.read_u8() != 0;
    }

    header.sample_rate = reader.read_f64();
    header.num_playback_streams = reader.read_u32();

    if (v2_layout) {
        const uint32_t num_streams = reader.read_u32();
        // Each descriptor is 3 bytes; reject counts the file cannot hold before reserving.
        if (!reader.fits(static_cast<uint64_t>(num_streams) * 3)) {
            throw LoadError(ErrorCode::IO_ERROR, "File ends inside the stream descriptors of '" + reader.path() + "'");
        }
        std::vector<StreamInfo> streams;
        streams.reserve(num_streams);
        for (uint32_t i = 0; i < num_streams; ++i) {
            StreamInfo info;
            info.data_type = reader.read_u8();
            info.samples_per_package = reader.read_u16();
            streams.push_back(info);
        }
        header.streams = std::move(streams);
    }

    header.num_columns = reader.read_u32();
    header.column_names_size = reader.read_u32();
    header.column_names = split_column_names(reader.read_ascii(header.column_names_size));

    header.pos_data_start = reader.tell();
    header.complete = true;
}

std::vector<std::string> HeaderReader::split_column_names(const std::string& names) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t tab = names.find('\t', start);
        if (tab == std::string::npos) {
            out.push_back(names.substr(start));
            break;
        }
        out.push_back(names.substr(start, tab - start));
        start = tab + 1;
    }
    return out;
}

} // namespace palmtree
