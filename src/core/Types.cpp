#include "palmtree/core/Types.hpp"

namespace palmtree {

const char* to_string(FileKind kind) {
    switch (kind) {
        case FileKind::SOURCE: return "source";
        case FileKind::PIPELINE: return "pipeline";
        case FileKind::PLUGIN: return "plugin";
        default: return "unknown";
    }
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_NOT_FOUND: return "FileNotFound";
        case ErrorCode::IO_ERROR: return "IOError";
        case ErrorCode::UNSUPPORTED_VERSION: return "UnsupportedVersion";
        case ErrorCode::MALFORMED_HEADER: return "MalformedHeader";
        case ErrorCode::ALLOCATION_FAILED: return "AllocationFailed";
        default: return "Unknown";
    }
}

}
