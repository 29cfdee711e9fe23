#include "palmtree/core/SystemUtils.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <fstream>
#include <string>
#include <sys/sysinfo.h>
#endif

namespace palmtree {

#ifndef _WIN32
namespace {

// Returns MemAvailable in bytes, or 0 if the field is missing.
uint64_t read_meminfo_available() {
    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo) {
        return 0;
    }
    std::string key;
    uint64_t value_kb = 0;
    std::string unit;
    while (meminfo >> key >> value_kb) {
        std::getline(meminfo, unit);
        if (key == "MemAvailable:") {
            return value_kb * 1024;
        }
    }
    return 0;
}

} // namespace
#endif

uint64_t SystemUtils::get_available_ram() {
#ifdef _WIN32
    MEMORYSTATUSEX statex;
    statex.dwLength = sizeof(statex);
    if (GlobalMemoryStatusEx(&statex)) {
        return statex.ullAvailPhys;
    }
    return 0;
#else
    const uint64_t available = read_meminfo_available();
    if (available > 0) {
        return available;
    }
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return (static_cast<uint64_t>(info.freeram) + info.bufferram) * info.mem_unit;
    }
    return 0;
#endif
}

uint64_t SystemUtils::get_total_ram() {
#ifdef _WIN32
    MEMORYSTATUSEX statex;
    statex.dwLength = sizeof(statex);
    if (GlobalMemoryStatusEx(&statex)) {
        return statex.ullTotalPhys;
    }
    return 0;
#else
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return static_cast<uint64_t>(info.totalram) * info.mem_unit;
    }
    return 0;
#endif
}

} // namespace palmtree
