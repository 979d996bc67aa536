#pragma once

#include <curl/curl.h>

namespace rangeget::detail {

// curl_global_init exactly once per process. Throws std::runtime_error.
void ensureCurlInitialized();

// Throws the exception matching a failed transfer: UnexpectedEof for a short
// body, std::system_error for a reset connection, TransportError otherwise
// (temporary or timed out where retrying may help).
[[noreturn]] void throwCurlError(CURLcode code, long os_errno, const char* detail);

} // namespace rangeget::detail
