#pragma once

#include "byte_range.hpp"
#include "diagnostics.hpp"
#include "http.hpp"
#include "output_file.hpp"
#include "progress.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace rangeget {

// Downloads one ByteRange into its place in the output file, retrying
// transient faults from the start of the range.
class SegmentFetcher {
public:
    SegmentFetcher(HttpClient& client, OutputFile& output, ProgressReporter& progress, Diagnostics& log)
        : client_(client), output_(output), progress_(progress), log_(log) {}

    // Throws DownloadError (transfer or retry_exhausted) on failure. retries is
    // the number of transient faults tolerated for this range.
    void fetch(const std::string& url, const ByteRange& range, unsigned retries) const;

private:
    struct Fault {
        std::exception_ptr error;
        std::string reason;
    };

    // Empty on success, the transient fault otherwise. Fatal faults throw.
    // credited counts the bytes already handed to the progress writer.
    std::optional<Fault> runAttempt(const std::string& url, const ByteRange& range,
                                    std::uint64_t& credited) const;

    HttpClient& client_;
    OutputFile& output_;
    ProgressReporter& progress_;
    Diagnostics& log_;
};

} // namespace rangeget
