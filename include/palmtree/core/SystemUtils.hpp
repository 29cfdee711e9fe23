#pragma once

#include <cstdint>

namespace palmtree {

class SystemUtils {
public:
    /**
     * @brief Get the physical memory (RAM) that can be claimed without swapping, in bytes.
     *
     * On Linux this is MemAvailable from /proc/meminfo (free + reclaimable cache),
     * falling back to sysinfo()'s free + buffer RAM on kernels that lack it.
     *
     * @return uint64_t Available RAM in bytes, or 0 if the OS could not be queried.
     */
    static uint64_t get_available_ram();

    /**
     * @brief Get the total physical memory (RAM) installed in the system in bytes.
     *
     * @return uint64_t Total RAM in bytes, or 0 if the OS could not be queried.
     */
    static uint64_t get_total_ram();
};

} // namespace palmtree
