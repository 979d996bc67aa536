#pragma once

#include "writer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace rangeget {

struct Progress {
    std::string filename;
    std::int64_t total_bytes{0};
    std::int64_t downloaded_bytes{0};
    bool is_running{false};
};

// Byte accounting for one transfer. Implementations must accept add() and
// writes through wrap() from several threads at once.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void setTotal(std::int64_t total) = 0;
    virtual void kickoff() = 0;
    // Negative deltas undo bytes credited by an abandoned attempt.
    virtual void add(std::int64_t delta) = 0;
    // Returns a writer that forwards to raw and credits every byte written.
    [[nodiscard]] virtual std::unique_ptr<Writer> wrap(std::unique_ptr<Writer> raw) = 0;
    virtual void finish() = 0;
};

} // namespace rangeget
