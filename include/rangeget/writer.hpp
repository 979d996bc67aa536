#pragma once

#include <cstddef>

namespace rangeget {

class Writer {
public:
    virtual ~Writer() = default;

    // Writes all size bytes or throws.
    virtual void write(const char* data, std::size_t size) = 0;
};

} // namespace rangeget
