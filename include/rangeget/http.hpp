#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rangeget {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

inline constexpr long kStatusOk = 200;
inline constexpr long kStatusPartialContent = 206;

// Case-insensitive lookup of the first header called name.
[[nodiscard]] std::optional<std::string> findHeader(const HttpHeaders& headers, std::string_view name);

struct HttpRequest {
    std::string method;
    std::string url;
    HttpHeaders headers;
};

// Builds a request after checking that url is an absolute http(s) URL.
// Throws InvalidUrl otherwise.
[[nodiscard]] HttpRequest makeRequest(std::string method, std::string url);

// Pull side of a response body.
class BodyReader {
public:
    virtual ~BodyReader() = default;

    // Copies up to size bytes into buffer. Returns 0 at end of body and
    // throws when the stream breaks.
    virtual std::size_t read(char* buffer, std::size_t size) = 0;
};

struct HttpResponse {
    long status_code{0};
    HttpHeaders headers;
    std::int64_t content_length{-1};   // -1 when the server did not say
    std::string resolved_url;          // after redirects
    std::unique_ptr<BodyReader> body;  // null for bodiless responses
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Returns once the status line and headers are known; the body is read
    // lazily through HttpResponse::body. Throws on transport failure.
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

} // namespace rangeget
