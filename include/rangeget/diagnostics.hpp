#pragma once

#include <mutex>
#include <ostream>
#include <utility>

#include <fmt/format.h>

namespace rangeget {

// Human-readable log lines, one per call, safe to use from worker threads.
class Diagnostics {
public:
    explicit Diagnostics(std::ostream& out) : out_(out) {}

    template <typename... Args>
    void print(fmt::format_string<Args...> format, Args&&... args) {
        const auto line = fmt::format(format, std::forward<Args>(args)...);
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << line << '\n';
        out_.flush();
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace rangeget
