#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace palmtree::io {

/**
 * @brief Seekable little-endian reader over one run-data file.
 *
 * Opens the file read-only and keeps its own cursor. Every read is bounds
 * checked against the size observed at open time; running past the end
 * throws LoadError(IO_ERROR). Not thread-safe; each load owns one reader.
 */
class ByteReader {
public:
    /**
     * @brief Opens `path` for reading.
     * @throws LoadError FILE_NOT_FOUND if the path does not exist,
     *         IO_ERROR if it exists but cannot be opened as a regular file.
     */
    explicit ByteReader(const std::string& path);

    const std::string& path() const { return path_; }
    uint64_t file_size() const { return file_size_; }
    uint64_t tell() const { return position_; }

    // Bytes left between the cursor and the end of the file.
    uint64_t remaining() const { return file_size_ - position_; }

    // True when `bytes` more bytes are available at the cursor.
    bool fits(uint64_t bytes) const { return bytes <= remaining(); }

    void seek(uint64_t offset);
    void skip(uint64_t bytes);

    uint8_t read_u8();
    uint16_t read_u16();
    uint32_t read_u32();
    uint64_t read_u64();
    double read_f64();

    std::string read_ascii(uint64_t length);

    // Bulk read of `count` little-endian doubles straight into `out`.
    void read_f64_array(double* out, uint64_t count);

private:
    void read_bytes(uint8_t* out, uint64_t length);

    std::string path_;
    std::ifstream stream_;
    uint64_t file_size_ = 0;
    uint64_t position_ = 0;
    std::vector<uint8_t> scratch_;
};

} // namespace palmtree::io
