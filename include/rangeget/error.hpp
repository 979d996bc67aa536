#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rangeget {

enum class ErrorKind {
    configuration,
    resolution,
    probe_construction,
    probe_request,
    planning,
    retry_exhausted,
    transfer,
    sink,
};

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

// Every fatal outcome of Downloader::get. The originating exception is kept
// as a std::nested_exception when there is one.
class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Throws DownloadError("<prefix>: <cause.what()>") nested over the exception
// currently being handled. Must be called from inside a catch block.
[[noreturn]] void rethrowAs(ErrorKind kind, std::string_view prefix, const std::exception& cause);

// Implemented by errors that know whether retrying them may succeed.
class NetError {
public:
    virtual ~NetError() = default;

    [[nodiscard]] virtual bool temporary() const noexcept = 0;
    [[nodiscard]] virtual bool timeout() const noexcept = 0;
};

// Body ended before the announced length was received.
class UnexpectedEof : public std::runtime_error {
public:
    UnexpectedEof() : std::runtime_error("unexpected EOF") {}
    explicit UnexpectedEof(const std::string& message) : std::runtime_error(message) {}
};

class TransportError : public std::runtime_error, public NetError {
public:
    explicit TransportError(const std::string& message, bool temporary = false, bool timeout = false)
        : std::runtime_error(message), temporary_(temporary), timeout_(timeout) {}

    [[nodiscard]] bool temporary() const noexcept override { return temporary_; }
    [[nodiscard]] bool timeout() const noexcept override { return timeout_; }

private:
    bool temporary_;
    bool timeout_;
};

class InvalidUrl : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

enum class Retryability { retryable, fatal };

struct Classification {
    Retryability outcome{Retryability::fatal};
    std::string reason;

    [[nodiscard]] bool retryable() const noexcept { return outcome == Retryability::retryable; }
};

// Retryable when the error or anything in its nested cause chain is an
// UnexpectedEof, a connection reset, or a NetError reporting temporary/timeout.
[[nodiscard]] Classification classify(const std::exception& error);

} // namespace rangeget
