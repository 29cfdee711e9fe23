#pragma once

#include <cstdint>

namespace palmtree {

enum class DataType : uint32_t {
    UNKNOWN = 0,
    INT32 = 2,
    FLOAT64 = 3
};

// Derived from the 3-character code in the preamble ("src", "dat", anything else).
enum class FileKind : uint32_t {
    SOURCE = 0,
    PIPELINE = 1,
    PLUGIN = 2
};

enum class ErrorCode : uint32_t {
    FILE_NOT_FOUND = 1,
    IO_ERROR = 2,
    UNSUPPORTED_VERSION = 3,
    MALFORMED_HEADER = 4,
    ALLOCATION_FAILED = 5
};

enum class LogLevel : uint32_t {
    SILENT = 0,
    ERRORS = 1,
    WARNINGS = 2
};

const char* to_string(FileKind kind);
const char* to_string(ErrorCode code);

}
