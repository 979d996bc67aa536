#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/error.hpp"

#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>

#include <fmt/format.h>

namespace rangeget::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

[[noreturn]] void throwCurlError(CURLcode code, long os_errno, const char* detail) {
    const std::string message = (detail && *detail)
                                    ? fmt::format("{}: {}", curl_easy_strerror(code), detail)
                                    : std::string{curl_easy_strerror(code)};
    switch (code) {
        case CURLE_PARTIAL_FILE:
            throw UnexpectedEof(message);
        case CURLE_OPERATION_TIMEDOUT:
            throw TransportError(message, false, true);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
            if (os_errno == ECONNRESET) {
                throw std::system_error(ECONNRESET, std::generic_category(), message);
            }
            throw TransportError(message);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_GOT_NOTHING:
            throw TransportError(message, true);
        default:
            throw TransportError(message);
    }
}

} // namespace rangeget::detail
