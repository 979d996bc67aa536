#include "rangeget/segment_fetcher.hpp"
#include "rangeget/error.hpp"

#include <array>
#include <memory>
#include <utility>

#include <fmt/format.h>

namespace rangeget {

namespace {
constexpr std::size_t kCopyBufferSize = 16 * 1024;
} // namespace

void SegmentFetcher::fetch(const std::string& url, const ByteRange& range, unsigned retries) const {
    if (range.length() == 0) {
        return;
    }

    unsigned remaining = retries;
    while (true) {
        std::uint64_t credited = 0;
        const auto fault = runAttempt(url, range, credited);
        if (!fault) {
            return;
        }

        if (remaining == 0) {
            try {
                std::rethrow_exception(fault->error);
            } catch (const std::exception& e) {
                rethrowAs(ErrorKind::retry_exhausted, "maximum retries reached", e);
            }
        }
        --remaining;

        //丢弃本次已写入的部分, 从 lower 重新开始
        if (credited > 0) {
            progress_.add(-static_cast<std::int64_t>(credited));
        }
        log_.print("retrying {} ({} of {}): {}", range.header(), retries - remaining, retries, fault->reason);
    }
}

std::optional<SegmentFetcher::Fault> SegmentFetcher::runAttempt(const std::string& url,
                                                                const ByteRange& range,
                                                                std::uint64_t& credited) const {
    auto request = makeRequest("GET", url);
    request.headers.emplace_back("Range", range.header());

    HttpResponse response;
    try {
        response = client_.execute(request);
    } catch (const std::exception& e) {
        auto fault = classify(e);
        if (fault.retryable()) {
            return Fault{std::current_exception(), std::move(fault.reason)};
        }
        rethrowAs(ErrorKind::transfer, "download request failed", e);
    }

    if (response.status_code != kStatusPartialContent) {
        throw DownloadError(ErrorKind::transfer,
                            fmt::format("during GET unexpected status code was returned: {}",
                                        response.status_code));
    }
    if (!response.body) {
        return std::nullopt;
    }

    auto writer = progress_.wrap(std::make_unique<OffsetWriter>(output_, range.lower));
    std::array<char, kCopyBufferSize> buffer{};
    const std::uint64_t expected = range.length();
    try {
        while (true) {
            const std::size_t count = response.body->read(buffer.data(), buffer.size());
            if (count == 0) {
                break;
            }
            //超出本分段的数据会覆盖相邻分段, 不能写入
            const std::uint64_t room = expected - credited;
            if (count > room) {
                if (room > 0) {
                    writer->write(buffer.data(), static_cast<std::size_t>(room));
                    credited += room;
                }
                throw DownloadError(ErrorKind::transfer,
                                    fmt::format("response for {} is longer than the {} bytes requested",
                                                range.header(), expected));
            }
            writer->write(buffer.data(), count);
            credited += count;
        }
    } catch (const DownloadError&) {
        throw;
    } catch (const std::exception& e) {
        auto fault = classify(e);
        if (fault.retryable()) {
            return Fault{std::current_exception(), std::move(fault.reason)};
        }
        rethrowAs(ErrorKind::transfer, "failed to write file during copy", e);
    }

    return std::nullopt;
}

} // namespace rangeget
