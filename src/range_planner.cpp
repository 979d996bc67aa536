#include "rangeget/range_planner.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace rangeget {

std::uint64_t RangePlanner::checkedLength(std::int64_t total_length) {
    if (total_length < 0) {
        throw std::invalid_argument(fmt::format("invalid content length: {}", total_length));
    }
    return static_cast<std::uint64_t>(total_length);
}

std::vector<ByteRange> RangePlanner::split(std::uint64_t total_length, std::uint64_t part_size) {
    std::vector<ByteRange> ranges;
    if (total_length == 0) {
        return ranges;
    }

    part_size = std::max<std::uint64_t>(1, part_size);
    ranges.reserve(static_cast<std::size_t>((total_length + part_size - 1) / part_size));
    for (std::uint64_t start = 0; start < total_length; start += part_size) {
        const std::uint64_t end = std::min(start + part_size, total_length);
        ranges.push_back(ByteRange{start, end - 1});
    }
    return ranges;
}

SegmentCountPlanner::SegmentCountPlanner(std::size_t segment_count)
    : segment_count_(segment_count) {
    if (segment_count_ == 0) {
        throw std::invalid_argument("segment count must be positive");
    }
}

std::vector<ByteRange> SegmentCountPlanner::plan(std::int64_t total_length) const {
    const std::uint64_t total = checkedLength(total_length);
    const std::uint64_t count = static_cast<std::uint64_t>(segment_count_);
    //向上取整, 保证分段数不超过 segment_count_
    return split(total, (total + count - 1) / count);
}

SegmentSizePlanner::SegmentSizePlanner(std::uint64_t segment_size)
    : segment_size_(segment_size) {
    if (segment_size_ == 0) {
        throw std::invalid_argument("segment size must be positive");
    }
}

std::vector<ByteRange> SegmentSizePlanner::plan(std::int64_t total_length) const {
    return split(checkedLength(total_length), segment_size_);
}

} // namespace rangeget
