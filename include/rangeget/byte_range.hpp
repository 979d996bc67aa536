#pragma once

#include <cstdint>
#include <string>

namespace rangeget {

// Inclusive byte bounds of one segment, as in an HTTP Range header.
struct ByteRange {
    std::uint64_t lower{0};
    std::uint64_t upper{0};

    [[nodiscard]] std::uint64_t length() const noexcept {
        return upper < lower ? 0 : upper - lower + 1;
    }

    // "bytes=<lower>-<upper>"
    [[nodiscard]] std::string header() const;

    friend bool operator==(const ByteRange& lhs, const ByteRange& rhs) noexcept {
        return lhs.lower == rhs.lower && lhs.upper == rhs.upper;
    }
    friend bool operator!=(const ByteRange& lhs, const ByteRange& rhs) noexcept {
        return !(lhs == rhs);
    }
};

} // namespace rangeget
