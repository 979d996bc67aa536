#include "rangeget/terminal_progress.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <utility>

#include <fmt/format.h>

namespace rangeget {

namespace {

class CountingWriter final : public Writer {
public:
    CountingWriter(std::unique_ptr<Writer> inner, std::atomic<std::int64_t>& counter)
        : inner_(std::move(inner)), counter_(counter) {}

    void write(const char* data, std::size_t size) override {
        inner_->write(data, size);
        counter_ += static_cast<std::int64_t>(size);
    }

private:
    std::unique_ptr<Writer> inner_;
    std::atomic<std::int64_t>& counter_;
};

} // namespace

TerminalProgress::TerminalProgress(std::ostream& out, std::string filename, std::chrono::milliseconds refresh)
    : out_(out), filename_(std::move(filename)), refresh_(refresh) {}

TerminalProgress::~TerminalProgress() { stopRenderer(); }

void TerminalProgress::setTotal(std::int64_t total) { total_ = total; }

void TerminalProgress::kickoff() {
    if (running_.exchange(true)) {
        return;
    }
    renderer_ = std::thread([this]() { renderLoop(); });
}

void TerminalProgress::add(std::int64_t delta) { downloaded_ += delta; }

std::unique_ptr<Writer> TerminalProgress::wrap(std::unique_ptr<Writer> raw) {
    return std::make_unique<CountingWriter>(std::move(raw), downloaded_);
}

void TerminalProgress::finish() {
    stopRenderer();
    std::lock_guard<std::mutex> lock(render_mutex_);
    redraw();
    out_ << std::flush;
}

Progress TerminalProgress::snapshot() const {
    return {filename_, total_.load(), downloaded_.load(), running_.load()};
}

void TerminalProgress::renderLoop() {
    std::unique_lock<std::mutex> lock(render_mutex_);
    while (running_) {
        redraw();
        wake_.wait_for(lock, refresh_, [this]() { return !running_; });
    }
}

void TerminalProgress::stopRenderer() {
    {
        std::lock_guard<std::mutex> lock(render_mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (renderer_.joinable()) {
        renderer_.join();
    }
}

void TerminalProgress::redraw() {
    const std::string panel = formatLine(snapshot()) + '\n';
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

std::string TerminalProgress::formatLine(const Progress& progress) {
    std::string display_name = std::filesystem::path{progress.filename}.filename().string();
    if (display_name.empty()) {
        display_name = progress.filename;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (progress.total_bytes <= 0) {
        if (!progress.is_running) {
            return fmt::format("{:<20} {}  Done", display_name, formatSize(
                static_cast<std::uint64_t>(std::max<std::int64_t>(0, progress.downloaded_bytes))));
        }
        return fmt::format("{:<20} [Initializing...]", display_name);
    }

    const auto downloaded = static_cast<std::uint64_t>(std::max<std::int64_t>(0, progress.downloaded_bytes));
    const auto total = static_cast<std::uint64_t>(progress.total_bytes);
    const double ratio = std::min(1.0, static_cast<double>(downloaded) / static_cast<double>(total));
    const int percent = static_cast<int>(ratio * 100.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    std::string line = fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                                   formatSize(downloaded), formatSize(total));
    if (!progress.is_running && downloaded >= total) {
        line.append("  Done");
    }
    return line;
}

std::string TerminalProgress::formatSize(std::uint64_t bytes) {
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }

    //TB 以上仍按 TB 显示
    static constexpr std::array<const char*, 4> kUnits{"KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

} // namespace rangeget
