#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>

namespace palmtree::io {

// Decoders for little-endian fields; independent of host byte order.

inline uint16_t load_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

inline uint32_t load_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

inline uint64_t load_u64_le(const uint8_t* p) {
    return static_cast<uint64_t>(load_u32_le(p))
         | (static_cast<uint64_t>(load_u32_le(p + 4)) << 32);
}

inline double load_f64_le(const uint8_t* p) {
    return std::bit_cast<double>(load_u64_le(p));
}

// Decodes `count` consecutive little-endian doubles from `src` into `out`.
inline void load_f64_array_le(const uint8_t* src, double* out, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        out[i] = load_f64_le(src + i * sizeof(double));
    }
}

} // namespace palmtree::io
