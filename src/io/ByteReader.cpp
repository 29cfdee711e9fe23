#include "palmtree/io/ByteReader.hpp"
#include "palmtree/io/Endian.hpp"
#include "palmtree/format/LoadError.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace palmtree::io {

namespace {

// Upper bound on the staging buffer used by bulk reads (in doubles).
constexpr uint64_t kBulkBlockValues = 8192;

// Forward moves up to this many bytes are read through the stream buffer
// instead of seeking, which would discard the buffer.
constexpr uint64_t kForwardReadThrough = 64 * 1024;

} // namespace

ByteReader::ByteReader(const std::string& path) : path_(path) {
    std::error_code ec;
    const std::filesystem::path fs_path(path);
    const bool exists = std::filesystem::exists(fs_path, ec);
    if (ec) {
        throw LoadError(ErrorCode::IO_ERROR, "Could not access file at: '" + path + "' (" + ec.message() + ")");
    }
    if (!exists) {
        throw LoadError(ErrorCode::FILE_NOT_FOUND, "Could not locate file at: '" + path + "'");
    }
    if (!std::filesystem::is_regular_file(fs_path, ec)) {
        throw LoadError(ErrorCode::IO_ERROR, "Could not access file at: '" + path + "' (not a regular file)");
    }

    const auto size = std::filesystem::file_size(fs_path, ec);
    if (ec) {
        throw LoadError(ErrorCode::IO_ERROR, "Could not access file at: '" + path + "' (" + ec.message() + ")");
    }
    file_size_ = static_cast<uint64_t>(size);

    stream_.open(fs_path, std::ios::in | std::ios::binary);
    if (!stream_.is_open()) {
        throw LoadError(ErrorCode::IO_ERROR, "Could not access file at: '" + path + "'");
    }
}

void ByteReader::seek(uint64_t offset) {
    if (offset > file_size_) {
        throw LoadError(ErrorCode::IO_ERROR, "Seek beyond end of file in '" + path_ + "'");
    }
    if (offset == position_) {
        return;
    }
    if (offset > position_ && offset - position_ <= kForwardReadThrough) {
        const uint64_t distance = offset - position_;
        stream_.ignore(static_cast<std::streamsize>(distance));
        if (static_cast<uint64_t>(stream_.gcount()) != distance) {
            throw LoadError(ErrorCode::IO_ERROR, "Failed to skip forward in '" + path_ + "'");
        }
        position_ = offset;
        return;
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_) {
        throw LoadError(ErrorCode::IO_ERROR, "Failed to seek in '" + path_ + "'");
    }
    position_ = offset;
}

void ByteReader::skip(uint64_t bytes) {
    if (!fits(bytes)) {
        throw LoadError(ErrorCode::IO_ERROR, "Skip beyond end of file in '" + path_ + "'");
    }
    seek(position_ + bytes);
}

void ByteReader::read_bytes(uint8_t* out, uint64_t length) {
    if (!fits(length)) {
        throw LoadError(ErrorCode::IO_ERROR,
                        "Unexpected end of file in '" + path_ + "' at offset " + std::to_string(position_));
    }
    if (length == 0) {
        return;
    }
    stream_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(stream_.gcount()) != length) {
        throw LoadError(ErrorCode::IO_ERROR, "Failed to read from '" + path_ + "'");
    }
    position_ += length;
}

uint8_t ByteReader::read_u8() {
    uint8_t b = 0;
    read_bytes(&b, 1);
    return b;
}

uint16_t ByteReader::read_u16() {
    uint8_t b[2];
    read_bytes(b, sizeof(b));
    return load_u16_le(b);
}

uint32_t ByteReader::read_u32() {
    uint8_t b[4];
    read_bytes(b, sizeof(b));
    return load_u32_le(b);
}

uint64_t ByteReader::read_u64() {
    uint8_t b[8];
    read_bytes(b, sizeof(b));
    return load_u64_le(b);
}

double ByteReader::read_f64() {
    uint8_t b[8];
    read_bytes(b, sizeof(b));
    return load_f64_le(b);
}

std::string ByteReader::read_ascii(uint64_t length) {
    if (!fits(length)) {
        throw LoadError(ErrorCode::IO_ERROR,
                        "Unexpected end of file in '" + path_ + "' at offset " + std::to_string(position_));
    }
    std::string s(static_cast<size_t>(length), '\0');
    read_bytes(reinterpret_cast<uint8_t*>(s.data()), length);
    return s;
}

void ByteReader::read_f64_array(double* out, uint64_t count) {
    if (count > remaining() / sizeof(double)) {
        throw LoadError(ErrorCode::IO_ERROR,
                        "Unexpected end of file in '" + path_ + "' at offset " + std::to_string(position_));
    }
    while (count > 0) {
        const uint64_t block = std::min(count, kBulkBlockValues);
        scratch_.resize(static_cast<size_t>(block * sizeof(double)));
        read_bytes(scratch_.data(), block * sizeof(double));
        load_f64_array_le(scratch_.data(), out, static_cast<size_t>(block));
        out += block;
        count -= block;
    }
}

} // namespace palmtree::io
