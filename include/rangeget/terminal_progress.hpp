#pragma once

#include "progress.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace rangeget {

// ProgressReporter that redraws a one-line bar on a terminal stream.
class TerminalProgress final : public ProgressReporter {
public:
    TerminalProgress(std::ostream& out, std::string filename,
                     std::chrono::milliseconds refresh = std::chrono::milliseconds(200));
    ~TerminalProgress() override;

    TerminalProgress(const TerminalProgress&) = delete;
    TerminalProgress& operator=(const TerminalProgress&) = delete;

    void setTotal(std::int64_t total) override;
    void kickoff() override;
    void add(std::int64_t delta) override;
    [[nodiscard]] std::unique_ptr<Writer> wrap(std::unique_ptr<Writer> raw) override;
    void finish() override;

    [[nodiscard]] Progress snapshot() const;

    static std::string formatLine(const Progress& progress);
    static std::string formatSize(std::uint64_t bytes);

private:
    void renderLoop();
    void stopRenderer();
    void redraw();

    std::ostream& out_;
    std::string filename_;
    std::chrono::milliseconds refresh_;

    std::atomic<std::int64_t> total_{0};
    std::atomic<std::int64_t> downloaded_{0};
    std::atomic<bool> running_{false};

    std::mutex render_mutex_;
    std::condition_variable wake_;
    std::thread renderer_;
    std::size_t previous_lines_{0};
};

} // namespace rangeget
