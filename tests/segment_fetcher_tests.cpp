#include "rangeget/segment_fetcher.hpp"

#include "fakes.hpp"

#include <catch2/catch.hpp>

#include <cerrno>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

using namespace rangeget;
using namespace rangeget::testing;

namespace {

const std::string kUrl = "https://example.com/some-file";

struct Fixture {
    TempPath path;
    OutputFile output = OutputFile::create(path.string());
    FakeProgress progress;
    std::ostringstream log_stream;
    Diagnostics log{log_stream};

    std::string contents() {
        output.close();
        return readFile(path.string());
    }
};

} // namespace

TEST_CASE("SegmentFetcher writes a range at its offset", "[fetcher]") {
    Fixture fx;
    FakeHttpClient client{[](const HttpRequest&, std::size_t) { return partialResponse({"ct ", "content"}); }};
    const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

    fetcher.fetch(kUrl, ByteRange{10, 19}, 3);

    const auto requests = client.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "GET");
    CHECK(requests[0].url == kUrl);
    CHECK(findHeader(requests[0].headers, "range") == std::optional<std::string>{"bytes=10-19"});

    CHECK(fx.contents() == std::string(10, '\0') + "ct content");
    CHECK(fx.progress.net() == 10);
    CHECK(fx.progress.adds().empty());
}

TEST_CASE("SegmentFetcher skips an empty range", "[fetcher]") {
    Fixture fx;
    FakeHttpClient client{[](const HttpRequest&, std::size_t) -> HttpResponse {
        throw std::logic_error("no request expected");
    }};
    const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

    fetcher.fetch(kUrl, ByteRange{5, 4}, 0);

    CHECK(client.callCount() == 0);
}

TEST_CASE("SegmentFetcher restarts a range after a mid-stream fault", "[fetcher]") {
    Fixture fx;

    SECTION("unexpected EOF") {
        FakeHttpClient client{sequence({
            [] { return partialResponse({"some"}, fault(UnexpectedEof{})); },
            [] { return partialResponse({"something"}); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        fetcher.fetch(kUrl, ByteRange{0, 15}, 1);

        CHECK(client.callCount() == 2);
        REQUIRE_FALSE(fx.progress.adds().empty());
        CHECK(fx.progress.adds().front() == -4);
        CHECK(fx.progress.net() == 9);
        CHECK(fx.contents() == "something");
        CHECK_THAT(fx.log_stream.str(), Catch::Contains("retrying bytes=0-15 (1 of 1)"));
    }

    SECTION("connection reset") {
        FakeHttpClient client{sequence({
            [] {
                return partialResponse({"some"}, fault(std::system_error(ECONNRESET, std::generic_category(), "read")));
            },
            [] { return partialResponse({"something"}); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        fetcher.fetch(kUrl, ByteRange{0, 15}, 3);

        CHECK(fx.progress.adds() == std::vector<std::int64_t>{-4});
        CHECK(fx.contents() == "something");
    }

    SECTION("self-reported temporary error while reading") {
        FakeHttpClient client{sequence({
            [] { return partialResponse({"XXXX"}, fault(FlakyNetworkError("whoops"))); },
            [] { return partialResponse({"abcdefgh"}); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        fetcher.fetch(kUrl, ByteRange{0, 7}, 1);

        CHECK(fx.contents() == "abcdefgh");
        CHECK(fx.progress.net() == 8);
    }
}

TEST_CASE("SegmentFetcher retries a temporary request failure", "[fetcher]") {
    Fixture fx;
    FakeHttpClient client{sequence({
        []() -> HttpResponse { throw FlakyNetworkError("whoops"); },
        [] { return partialResponse({"something"}); },
    })};
    const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

    fetcher.fetch(kUrl, ByteRange{0, 15}, 1);

    CHECK(client.callCount() == 2);
    CHECK(fx.progress.adds().empty());
    CHECK(fx.contents() == "something");
}

TEST_CASE("SegmentFetcher gives up when the retry budget is spent", "[fetcher]") {
    Fixture fx;
    FakeHttpClient client{[](const HttpRequest&, std::size_t) {
        return partialResponse({"some"}, fault(UnexpectedEof{}));
    }};
    const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

    const unsigned retries = GENERATE(0u, 2u);
    try {
        fetcher.fetch(kUrl, ByteRange{0, 15}, retries);
        FAIL("fetch succeeded");
    } catch (const DownloadError& e) {
        CHECK(e.kind() == ErrorKind::retry_exhausted);
        CHECK_THAT(std::string{e.what()}, Catch::StartsWith("maximum retries reached"));
    }
    CHECK(client.callCount() == retries + 1);
    CHECK(fx.progress.adds().size() == retries);
}

TEST_CASE("SegmentFetcher fails fast on fatal faults", "[fetcher]") {
    Fixture fx;

    SECTION("unknown error while copying") {
        FakeHttpClient client{sequence({
            [] { return partialResponse({"some"}, fault(std::runtime_error("whoops"))); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        REQUIRE_THROWS_WITH(fetcher.fetch(kUrl, ByteRange{0, 15}, 3), "failed to write file during copy: whoops");
        CHECK(client.callCount() == 1);
    }

    SECTION("request error") {
        FakeHttpClient client{sequence({
            []() -> HttpResponse { throw std::runtime_error("failed GET"); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        REQUIRE_THROWS_WITH(fetcher.fetch(kUrl, ByteRange{0, 0}, 3), "download request failed: failed GET");
    }

    SECTION("unexpected status") {
        FakeHttpClient client{sequence({
            [] { return statusResponse(500); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        try {
            fetcher.fetch(kUrl, ByteRange{0, 0}, 3);
            FAIL("fetch succeeded");
        } catch (const DownloadError& e) {
            CHECK(e.kind() == ErrorKind::transfer);
            CHECK(std::string{e.what()} == "during GET unexpected status code was returned: 500");
        }
    }

    SECTION("write into a closed file") {
        fx.output.close();
        FakeHttpClient client{sequence({
            [] { return partialResponse({"something"}); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        REQUIRE_THROWS_WITH(fetcher.fetch(kUrl, ByteRange{0, 8}, 3),
                            Catch::StartsWith("failed to write file during copy"));
        CHECK(fx.progress.net() == 0);
    }
}

TEST_CASE("SegmentFetcher never writes past the end of its range", "[fetcher]") {
    Fixture fx;

    SECTION("oversized body in one chunk") {
        FakeHttpClient client{sequence({
            [] { return partialResponse({"AAAAAAAA"}); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        try {
            fetcher.fetch(kUrl, ByteRange{0, 3}, 3);
            FAIL("fetch succeeded");
        } catch (const DownloadError& e) {
            CHECK(e.kind() == ErrorKind::transfer);
            CHECK(std::string{e.what()} == "response for bytes=0-3 is longer than the 4 bytes requested");
        }
        CHECK(client.callCount() == 1);
        CHECK(fx.progress.net() == 4);
        CHECK(fx.contents() == "AAAA");
    }

    SECTION("surplus arriving in a later chunk") {
        FakeHttpClient client{sequence({
            [] { return partialResponse({"BB", "BBX", "YYYY"}); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        REQUIRE_THROWS_WITH(fetcher.fetch(kUrl, ByteRange{4, 7}, 3),
                            "response for bytes=4-7 is longer than the 4 bytes requested");
        CHECK(fx.progress.net() == 4);
        CHECK(fx.contents() == std::string(4, '\0') + "BBBB");
    }

    SECTION("exact length is accepted") {
        FakeHttpClient client{sequence({
            [] { return partialResponse({"BB", "BB"}); },
        })};
        const SegmentFetcher fetcher{client, fx.output, fx.progress, fx.log};

        fetcher.fetch(kUrl, ByteRange{0, 3}, 0);
        CHECK(fx.progress.net() == 4);
        CHECK(fx.contents() == "BBBB");
    }
}
