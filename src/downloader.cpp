#include "rangeget/downloader.hpp"
#include "rangeget/detail/worker_group.hpp"
#include "rangeget/diagnostics.hpp"
#include "rangeget/error.hpp"
#include "rangeget/segment_fetcher.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <exception>
#include <mutex>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace rangeget {

namespace {

// Calls ProgressReporter::finish on every exit once kickoff has happened.
class FinishGuard {
public:
    explicit FinishGuard(ProgressReporter& progress) : progress_(progress) {}
    ~FinishGuard() { progress_.finish(); }

    FinishGuard(const FinishGuard&) = delete;
    FinishGuard& operator=(const FinishGuard&) = delete;

private:
    ProgressReporter& progress_;
};

ErrorKind kindOf(const std::exception& error) {
    const auto* download_error = dynamic_cast<const DownloadError*>(&error);
    return download_error ? download_error->kind() : ErrorKind::transfer;
}

void transferAll(const SegmentFetcher& fetcher, const std::string& url,
                 const std::vector<ByteRange>& ranges, unsigned retries, std::size_t max_workers) {
    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto work = [&]() {
        //出错后不再领取新的分段, 已在进行的分段自行结束
        while (!failed.load()) {
            const std::size_t index = next.fetch_add(1);
            if (index >= ranges.size()) {
                return;
            }

            try {
                try {
                    fetcher.fetch(url, ranges[index], retries);
                } catch (const std::exception& e) {
                    rethrowAs(kindOf(e), "failed during retryable request", e);
                }
            } catch (const DownloadError&) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed = true;
            }
        }
    };

    const std::size_t worker_count = std::min(std::max<std::size_t>(1, max_workers), ranges.size());
    if (worker_count <= 1) {
        work();
    } else {
        detail::WorkerGroup workers;
        workers.reserve(worker_count);
        try {
            for (std::size_t i = 0; i < worker_count; ++i) {
                workers.spawn(work);
            }
        } catch (const std::system_error& e) {
            //停止领取分段, 等待已启动的线程结束
            failed = true;
            workers.join();
            rethrowAs(ErrorKind::transfer, "failed to start download worker", e);
        }
        workers.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace

unsigned parseRetries(const std::string& text, unsigned fallback) {
    if (text.empty()) {
        return fallback;
    }

    unsigned value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw DownloadError(ErrorKind::configuration,
                            fmt::format("could not convert download retries to number: {}", text));
    }
    return value;
}

Downloader::Downloader(HttpClient& client, const RangePlanner& planner, ProgressReporter& progress,
                       DownloaderOptions options)
    : client_(client), planner_(planner), progress_(progress), options_(std::move(options)) {}

void Downloader::get(OutputFile& output, LinkResolver& resolver, std::ostream& diagnostics) {
    const unsigned retries = parseRetries(options_.retries, options_.default_retries);
    Diagnostics log{diagnostics};

    std::string link;
    try {
        link = resolver.resolve();
    } catch (const std::exception& e) {
        rethrowAs(ErrorKind::resolution, "failed to fetch download link", e);
    }

    const auto target = probe(link);
    const auto ranges = planRanges(target.content_length);

    progress_.setTotal(target.content_length);
    progress_.kickoff();
    const FinishGuard finish{progress_};

    prepareOutput(output, target.content_length);

    log.print("downloading {} ({} bytes, {} segments, {} retries)", target.url, target.content_length,
              ranges.size(), retries);
    const SegmentFetcher fetcher{client_, output, progress_, log};
    transferAll(fetcher, target.url, ranges, retries, options_.max_workers);
    log.print("finished {}", output.path());
}

Downloader::Probe Downloader::probe(const std::string& link) {
    HttpRequest request;
    try {
        request = makeRequest("HEAD", link);
    } catch (const std::exception& e) {
        rethrowAs(ErrorKind::probe_construction, "failed to construct probe request", e);
    }

    HttpResponse response;
    try {
        response = client_.execute(request);
    } catch (const std::exception& e) {
        rethrowAs(ErrorKind::probe_request, "failed to make probe request", e);
    }
    response.body.reset();

    if (response.status_code >= 400) {
        throw DownloadError(ErrorKind::probe_request,
                            fmt::format("probe returned unexpected status code: {}", response.status_code));
    }

    //后续分段请求都使用重定向后的地址
    std::string url = response.resolved_url.empty() ? link : std::move(response.resolved_url);
    return Probe{std::move(url), response.content_length};
}

std::vector<ByteRange> Downloader::planRanges(std::int64_t content_length) const {
    try {
        return planner_.plan(content_length);
    } catch (const std::exception& e) {
        rethrowAs(ErrorKind::planning, "failed to construct range", e);
    }
}

void Downloader::prepareOutput(OutputFile& output, std::int64_t content_length) {
    try {
        static_cast<void>(output.size());
    } catch (const std::exception& e) {
        rethrowAs(ErrorKind::sink, "failed to read information from output file", e);
    }

    try {
        output.resize(static_cast<std::uint64_t>(std::max<std::int64_t>(0, content_length)));
    } catch (const std::exception& e) {
        rethrowAs(ErrorKind::sink, "failed to resize output file", e);
    }
}

} // namespace rangeget
