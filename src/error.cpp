#include "rangeget/error.hpp"

#include <system_error>

#include <fmt/format.h>

namespace rangeget {

namespace {

bool isConnectionReset(const std::exception& error) {
    const auto* system_error = dynamic_cast<const std::system_error*>(&error);
    return system_error && system_error->code() == std::errc::connection_reset;
}

bool isTransient(const std::exception& error) {
    if (dynamic_cast<const UnexpectedEof*>(&error) || isConnectionReset(error)) {
        return true;
    }
    const auto* net_error = dynamic_cast<const NetError*>(&error);
    return net_error && (net_error->temporary() || net_error->timeout());
}

} // namespace

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::configuration:      return "configuration";
        case ErrorKind::resolution:         return "resolution";
        case ErrorKind::probe_construction: return "probe construction";
        case ErrorKind::probe_request:      return "probe request";
        case ErrorKind::planning:           return "planning";
        case ErrorKind::retry_exhausted:    return "retry exhausted";
        case ErrorKind::transfer:           return "transfer";
        case ErrorKind::sink:               return "sink";
    }
    return "unknown";
}

void rethrowAs(ErrorKind kind, std::string_view prefix, const std::exception& cause) {
    std::throw_with_nested(DownloadError(kind, fmt::format("{}: {}", prefix, cause.what())));
}

Classification classify(const std::exception& error) {
    if (isTransient(error)) {
        return {Retryability::retryable, error.what()};
    }

    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& cause) {
        auto nested = classify(cause);
        if (nested.retryable()) {
            return nested;
        }
    }

    return {Retryability::fatal, error.what()};
}

} // namespace rangeget
