#pragma once

#include <atomic>
#include <cstdint>
#include <limits>
#include <new>
#include <optional>

#include "palmtree/core/MatrixTraits.hpp"
#include "palmtree/matrix/DenseMatrix.hpp"

namespace palmtree {
namespace core {

/**
 * @brief Details of a refused allocation.
 */
struct MemoryExhausted {
    uint64_t bytes_requested = 0;
    uint64_t bytes_available = 0;
};

/**
 * @brief Outcome of MemoryGuard::allocate: a matrix, or the reason there is none.
 */
template <typename T>
struct AllocationResult {
    std::optional<DenseMatrix<T>> matrix;
    MemoryExhausted failure;

    bool ok() const { return matrix.has_value(); }
};

/**
 * @brief The MemoryGuard checks the RAM budget before a decode buffer is committed.
 *
 * Allocating a large matrix when the machine cannot hold it either fails deep
 * inside the allocator or gets the process killed by the OS. The guard polls
 * available physical memory first and reports a typed failure instead, so a
 * load can fail cleanly while the process carries on.
 */
class MemoryGuard {
public:
    static MemoryGuard& instance();
    ~MemoryGuard();

    // Delete copy/move
    MemoryGuard(const MemoryGuard&) = delete;
    MemoryGuard& operator=(const MemoryGuard&) = delete;

    /**
     * @brief Allocates a rows x cols matrix with every cell set to fill_value.
     *
     * Never throws for insufficient memory; the result carries a MemoryExhausted
     * record when the preflight refuses the request, the byte size overflows,
     * or the allocator itself runs out.
     */
    template <typename T>
    AllocationResult<T> allocate(uint64_t rows, uint64_t cols, T fill_value) {
        AllocationResult<T> result;
        uint64_t elems = 0;
        uint64_t bytes = 0;
        if (mul_overflow_u64(rows, cols, &elems) || mul_overflow_u64(elems, sizeof(T), &bytes)) {
            result.failure.bytes_requested = (std::numeric_limits<uint64_t>::max)();
            result.failure.bytes_available = get_available_system_ram();
            report_exhausted(result.failure, MatrixTraits<T>::name);
            return result;
        }

        if (!preflight(bytes, &result.failure)) {
            report_exhausted(result.failure, MatrixTraits<T>::name);
            return result;
        }

        try {
            result.matrix.emplace(rows, cols, fill_value);
        } catch (const std::bad_alloc&) {
            result.matrix.reset();
            result.failure.bytes_requested = bytes;
            result.failure.bytes_available = get_available_system_ram();
            report_exhausted(result.failure, MatrixTraits<T>::name);
        }
        return result;
    }

    /**
     * @brief Checks if the requested amount of memory fits in RAM.
     * @return true if available RAM > size_bytes + safety_margin.
     */
    bool can_fit_in_ram(uint64_t size_bytes) const;

    // --- Statistics & Diagnostics ---

    /**
     * @brief Returns the total physical RAM installed on the system.
     */
    uint64_t get_total_system_ram() const;

    /**
     * @brief Returns the currently available physical RAM on the system.
     * This is a dynamic value polled from the OS unless a test override is set.
     */
    uint64_t get_available_system_ram() const;

    /**
     * @brief Returns the configured safety margin (bytes to leave free for OS).
     */
    uint64_t get_safety_margin() const;

    /**
     * @brief Sets the safety margin.
     * @param bytes Bytes to reserve for the OS/other apps.
     */
    void set_safety_margin(uint64_t bytes);

    /**
     * @brief Pins the reported available RAM to a fixed value. FOR TESTING ONLY.
     */
    void set_available_ram_override_for_testing(std::optional<uint64_t> bytes);

    /**
     * @brief Resets the guard state. FOR TESTING ONLY.
     */
    void reset_for_testing();

private:
    MemoryGuard();

    // Returns false (and fills `failure`) when the memory check refuses `bytes`.
    bool preflight(uint64_t bytes, MemoryExhausted* failure) const;

    void report_exhausted(const MemoryExhausted& failure, const char* type_name) const;

    static bool mul_overflow_u64(uint64_t a, uint64_t b, uint64_t* out) {
        if (a == 0 || b == 0) {
            *out = 0;
            return false;
        }
        if (a > (std::numeric_limits<uint64_t>::max)() / b) {
            return true;
        }
        *out = a * b;
        return false;
    }

    std::atomic<uint64_t> safety_margin_{0};

    // 0 means "no override"; the value is stored +1 so an override of 0 bytes is representable.
    std::atomic<uint64_t> available_override_plus_one_{0};
};

} // namespace core
} // namespace palmtree
