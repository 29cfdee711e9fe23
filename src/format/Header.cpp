#include "palmtree/format/Header.hpp"

#include <algorithm>
#include <cctype>

namespace palmtree {

FileKind file_kind_from_code(const std::string& code) {
    std::string lower = code;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "src") return FileKind::SOURCE;
    if (lower == "dat") return FileKind::PIPELINE;
    return FileKind::PLUGIN;
}

FileKind Header::kind() const {
    return file_kind_from_code(code);
}

uint32_t Header::num_streams() const {
    return streams ? static_cast<uint32_t>(streams->size()) : 0;
}

uint16_t Header::max_samples_stream() const {
    uint16_t max_samples = 0;
    if (streams) {
        for (const auto& s : *streams) {
            max_samples = std::max(max_samples, s.samples_per_package);
        }
    }
    return max_samples;
}

bool Header::uses_chunked_packages() const {
    return kind() == FileKind::PIPELINE && max_samples_stream() > 1;
}

bool Header::has_source_input_time() const {
    return kind() == FileKind::SOURCE && includes_source_input_time.value_or(false);
}

uint32_t Header::header_columns() const {
    return has_source_input_time() ? 3 : 2;
}

} // namespace palmtree
