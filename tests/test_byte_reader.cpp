#include <gtest/gtest.h>
#include "palmtree/io/ByteReader.hpp"
#include "palmtree/format/LoadError.hpp"
#include "RunFileBuilder.hpp"

#include <filesystem>
#include <optional>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace palmtree;
using palmtree::testing::RunFileBuilder;

class ByteReaderTest : public palmtree::testing::TempFileTest {};

TEST_F(ByteReaderTest, DecodesLittleEndianScalars) {
    RunFileBuilder b;
    b.u8(0xAB).u16(0x1234).u32(0xDEADBEEF).u64(0x0102030405060708ULL).f64(-2.5).ascii("src");
    io::ByteReader reader(write_temp_file("scalars.bin", b));

    EXPECT_EQ(reader.file_size(), 1u + 2 + 4 + 8 + 8 + 3);
    EXPECT_EQ(reader.read_u8(), 0xAB);
    EXPECT_EQ(reader.read_u16(), 0x1234);
    EXPECT_EQ(reader.read_u32(), 0xDEADBEEFu);
    EXPECT_EQ(reader.read_u64(), 0x0102030405060708ULL);
    EXPECT_DOUBLE_EQ(reader.read_f64(), -2.5);
    EXPECT_EQ(reader.read_ascii(3), "src");
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST_F(ByteReaderTest, RawBytesAreLittleEndian) {
    RunFileBuilder b;
    b.u8(0x01).u8(0x00).u8(0x00).u8(0x00);
    io::ByteReader reader(write_temp_file("raw.bin", b));
    EXPECT_EQ(reader.read_u32(), 1u);
}

TEST_F(ByteReaderTest, BulkReadSpansSeveralBlocks) {
    std::vector<double> values(20000);
    for (size_t i = 0; i < values.size(); ++i) values[i] = static_cast<double>(i) * 0.5;

    RunFileBuilder b;
    b.f64s(values);
    io::ByteReader reader(write_temp_file("bulk.bin", b));

    std::vector<double> out(values.size());
    reader.read_f64_array(out.data(), out.size());
    EXPECT_EQ(out, values);
    EXPECT_EQ(reader.tell(), values.size() * 8);
}

TEST_F(ByteReaderTest, ReadPastEndIsIoError) {
    RunFileBuilder b;
    b.u16(7);
    io::ByteReader reader(write_temp_file("short.bin", b));

    try {
        reader.read_u32();
        FAIL() << "Expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IO_ERROR);
    }
    // A failed read leaves the cursor where it was.
    EXPECT_EQ(reader.tell(), 0u);
    EXPECT_EQ(reader.read_u16(), 7);
}

TEST_F(ByteReaderTest, BulkReadPastEndIsIoError) {
    RunFileBuilder b;
    b.f64s({1.0, 2.0});
    io::ByteReader reader(write_temp_file("bulk_short.bin", b));

    std::vector<double> out(3);
    try {
        reader.read_f64_array(out.data(), out.size());
        FAIL() << "Expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IO_ERROR);
    }
}

TEST_F(ByteReaderTest, SeekAndSkipAreBounded) {
    RunFileBuilder b;
    b.u32(1).u32(2).u32(3);
    io::ByteReader reader(write_temp_file("seek.bin", b));

    reader.seek(8);
    EXPECT_EQ(reader.read_u32(), 3u);
    reader.seek(0);
    reader.skip(4);
    EXPECT_EQ(reader.read_u32(), 2u);

    EXPECT_TRUE(reader.fits(4));
    EXPECT_FALSE(reader.fits(5));
    EXPECT_THROW(reader.skip(5), LoadError);
    EXPECT_THROW(reader.seek(13), LoadError);

    // Seeking to exactly the end is allowed.
    reader.seek(12);
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST_F(ByteReaderTest, MissingFileIsFileNotFound) {
    const std::string path = make_temp_file("does_not_exist.dat");
    try {
        io::ByteReader reader(path);
        FAIL() << "Expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FILE_NOT_FOUND);
        EXPECT_FALSE(e.header().has_value());
    }
}

#ifndef _WIN32
TEST_F(ByteReaderTest, UnreachableFileIsIoError) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits are not enforced for root";
    }
    namespace fs = std::filesystem;

    const fs::path dir = make_temp_file("locked");
    fs::create_directory(dir);
    RunFileBuilder b;
    b.u32(1);
    b.write_to((dir / "run.dat").string());

    fs::permissions(dir, fs::perms::none);
    std::optional<LoadError> error;
    try {
        io::ByteReader reader((dir / "run.dat").string());
    } catch (const LoadError& e) {
        error = e;
    }
    fs::permissions(dir, fs::perms::owner_all);
    fs::remove_all(dir);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), ErrorCode::IO_ERROR);
    EXPECT_NE(std::string(error->what()).find("Could not access file"), std::string::npos);
}
#endif

TEST_F(ByteReaderTest, ForwardSeeksKeepTheCursorInStep) {
    std::vector<double> values(20000);
    for (size_t i = 0; i < values.size(); ++i) values[i] = static_cast<double>(i);

    RunFileBuilder b;
    b.f64s(values);
    io::ByteReader reader(write_temp_file("forward.bin", b));

    // Seeking to the cursor is a no-op.
    reader.seek(0);
    EXPECT_DOUBLE_EQ(reader.read_f64(), 0.0);
    reader.seek(8);
    EXPECT_DOUBLE_EQ(reader.read_f64(), 1.0);

    // Short forward moves, then a long one, then back.
    reader.seek(10 * 8);
    EXPECT_DOUBLE_EQ(reader.read_f64(), 10.0);
    reader.skip(5 * 8);
    EXPECT_DOUBLE_EQ(reader.read_f64(), 16.0);
    reader.seek(19000 * 8);
    EXPECT_DOUBLE_EQ(reader.read_f64(), 19000.0);
    reader.seek(2 * 8);
    EXPECT_DOUBLE_EQ(reader.read_f64(), 2.0);
    EXPECT_EQ(reader.tell(), 3u * 8);
}

TEST_F(ByteReaderTest, DirectoryIsIoError) {
    const auto dir = std::filesystem::temp_directory_path();
    try {
        io::ByteReader reader(dir.string());
        FAIL() << "Expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IO_ERROR);
    }
}
