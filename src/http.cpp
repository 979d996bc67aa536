#include "rangeget/http.hpp"
#include "rangeget/error.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <new>

#include <curl/curl.h>
#include <fmt/format.h>

namespace rangeget {

namespace {

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

} // namespace

std::optional<std::string> findHeader(const HttpHeaders& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

HttpRequest makeRequest(std::string method, std::string url) {
    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw std::bad_alloc();
    }

    const CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw InvalidUrl(fmt::format("parse \"{}\": {}", url, curl_url_strerror(rc)));
    }

    char* scheme = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_SCHEME, &scheme, 0) != CURLUE_OK) {
        throw InvalidUrl(fmt::format("parse \"{}\": missing scheme", url));
    }
    const std::unique_ptr<char, decltype(&curl_free)> scheme_guard{scheme, &curl_free};
    if (!equalsIgnoreCase(scheme, "http") && !equalsIgnoreCase(scheme, "https")) {
        throw InvalidUrl(fmt::format("parse \"{}\": unsupported scheme \"{}\"", url, scheme));
    }

    return HttpRequest{std::move(method), std::move(url), {}};
}

} // namespace rangeget
