#pragma once

#include "byte_range.hpp"
#include "http.hpp"
#include "link_resolver.hpp"
#include "output_file.hpp"
#include "progress.hpp"
#include "range_planner.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace rangeget {

struct DownloaderOptions {
    // Transient faults tolerated per segment, as configured text. Empty means
    // default_retries.
    std::string retries;
    unsigned default_retries{3};
    std::size_t max_workers{8};
};

// Parses DownloaderOptions::retries. Throws DownloadError(configuration).
[[nodiscard]] unsigned parseRetries(const std::string& text, unsigned fallback);

class Downloader {
public:
    Downloader(HttpClient& client, const RangePlanner& planner, ProgressReporter& progress,
               DownloaderOptions options = {});

    // Probes the resource behind resolver, then fetches it segment by segment
    // into output. Throws DownloadError on the first unrecoverable failure.
    void get(OutputFile& output, LinkResolver& resolver, std::ostream& diagnostics);

private:
    struct Probe {
        std::string url;
        std::int64_t content_length{-1};
    };

    Probe probe(const std::string& link);
    std::vector<ByteRange> planRanges(std::int64_t content_length) const;
    static void prepareOutput(OutputFile& output, std::int64_t content_length);

    HttpClient& client_;
    const RangePlanner& planner_;
    ProgressReporter& progress_;
    DownloaderOptions options_;
};

} // namespace rangeget
