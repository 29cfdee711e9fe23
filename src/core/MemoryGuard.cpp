#include "palmtree/core/MemoryGuard.hpp"
#include "palmtree/core/Config.hpp"
#include "palmtree/core/Log.hpp"
#include "palmtree/core/SystemUtils.hpp"

#include <sstream>

namespace palmtree {
namespace core {

MemoryGuard& MemoryGuard::instance() {
    static MemoryGuard instance;
    return instance;
}

MemoryGuard::MemoryGuard() {
    safety_margin_ = get_default_safety_margin();
}

MemoryGuard::~MemoryGuard() {
}

uint64_t MemoryGuard::get_total_system_ram() const {
    return SystemUtils::get_total_ram();
}

uint64_t MemoryGuard::get_available_system_ram() const {
    const uint64_t override_value = available_override_plus_one_.load();
    if (override_value != 0) {
        return override_value - 1;
    }
    return SystemUtils::get_available_ram();
}

uint64_t MemoryGuard::get_safety_margin() const {
    return safety_margin_;
}

void MemoryGuard::set_safety_margin(uint64_t bytes) {
    safety_margin_ = bytes;
}

void MemoryGuard::set_available_ram_override_for_testing(std::optional<uint64_t> bytes) {
    available_override_plus_one_ = bytes ? (*bytes + 1) : 0;
}

void MemoryGuard::reset_for_testing() {
    available_override_plus_one_ = 0;
    safety_margin_ = get_default_safety_margin();
}

bool MemoryGuard::can_fit_in_ram(uint64_t size_bytes) const {
    const uint64_t available = get_available_system_ram();
    const uint64_t margin = safety_margin_;

    // Saturate instead of wrapping when size + margin overflows.
    if (size_bytes > (std::numeric_limits<uint64_t>::max)() - margin) {
        return false;
    }
    return available > (size_bytes + margin);
}

bool MemoryGuard::preflight(uint64_t bytes, MemoryExhausted* failure) const {
    if (!is_memory_check_enabled()) {
        return true;
    }
    if (can_fit_in_ram(bytes)) {
        return true;
    }
    failure->bytes_requested = bytes;
    failure->bytes_available = get_available_system_ram();
    return false;
}

void MemoryGuard::report_exhausted(const MemoryExhausted& failure, const char* type_name) const {
    const double mb = 1024.0 * 1024.0;
    std::ostringstream msg;
    msg << "Not enough memory available to create " << type_name << " array. ";
    msg << "At least " << static_cast<uint64_t>(failure.bytes_requested / mb) << " MB is needed, ";
    msg << static_cast<uint64_t>(failure.bytes_available / mb) << " MB is available.";
    msg << " (for docker users: extend the memory resources available to the docker service)";
    log_error(msg.str());
}

} // namespace core
} // namespace palmtree
