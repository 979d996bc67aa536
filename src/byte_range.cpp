#include "rangeget/byte_range.hpp"

#include <fmt/format.h>

namespace rangeget {

std::string ByteRange::header() const {
    return fmt::format("bytes={}-{}", lower, upper);
}

} // namespace rangeget
