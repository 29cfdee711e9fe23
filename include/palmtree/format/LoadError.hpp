#pragma once

#include <optional>
#include <utility>
#include <stdexcept>
#include <string>

#include "palmtree/core/Types.hpp"
#include "palmtree/format/Header.hpp"

namespace palmtree {

/**
 * @brief A load that cannot produce a result.
 *
 * Carries the failure category and, when the preamble read had started, the
 * header as far as it was parsed. Truncated trailing data is not a LoadError;
 * it is reported through RunData::truncation.
 */
class LoadError : public std::runtime_error {
public:
    LoadError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    LoadError(ErrorCode code, const std::string& message, Header partial_header)
        : std::runtime_error(message), code_(code), header_(std::move(partial_header)) {}

    ErrorCode code() const { return code_; }

    const std::optional<Header>& header() const { return header_; }

    void attach_header(const Header& header) {
        if (!header_) header_ = header;
    }

private:
    ErrorCode code_;
    std::optional<Header> header_;
};

} // namespace palmtree
