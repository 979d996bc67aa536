#pragma once

#include <thread>
#include <utility>
#include <vector>

namespace rangeget::detail {

// Owns a set of std::thread and joins every started one on destruction, so a
// failed spawn never leaves a joinable thread behind.
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { join(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    void reserve(std::size_t count) { threads_.reserve(count); }

    // Throws std::system_error when the thread cannot be started.
    template <typename Fn>
    void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    void join() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

    [[nodiscard]] std::size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // namespace rangeget::detail
