#pragma once

#include "byte_range.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rangeget {

class RangePlanner {
public:
    virtual ~RangePlanner() = default;

    // Splits [0, total_length) into ordered, contiguous, non-overlapping ranges.
    // Throws std::invalid_argument when total_length is negative (unknown).
    // A zero length yields an empty plan.
    [[nodiscard]] virtual std::vector<ByteRange> plan(std::int64_t total_length) const = 0;

protected:
    static std::vector<ByteRange> split(std::uint64_t total_length, std::uint64_t part_size);
    static std::uint64_t checkedLength(std::int64_t total_length);
};

// At most segment_count ranges of (nearly) equal size.
class SegmentCountPlanner final : public RangePlanner {
public:
    explicit SegmentCountPlanner(std::size_t segment_count);

    [[nodiscard]] std::vector<ByteRange> plan(std::int64_t total_length) const override;

private:
    std::size_t segment_count_;
};

// Ranges of segment_size bytes; the last one may be shorter.
class SegmentSizePlanner final : public RangePlanner {
public:
    explicit SegmentSizePlanner(std::uint64_t segment_size);

    [[nodiscard]] std::vector<ByteRange> plan(std::int64_t total_length) const override;

private:
    std::uint64_t segment_size_;
};

} // namespace rangeget
