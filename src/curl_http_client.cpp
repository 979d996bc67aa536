#include "rangeget/curl_http_client.hpp"
#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/error.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <new>
#include <string_view>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace rangeget {

namespace {

constexpr int kPollTimeoutMs = 1000;

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' ||
                             text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

// One request on its own multi handle. The body is pulled: curl is only
// driven while the local buffer is empty.
class CurlTransfer final : public BodyReader {
public:
    CurlTransfer(const HttpRequest& request, const CurlHttpClient::Options& options);
    ~CurlTransfer() override;

    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    std::size_t read(char* buffer, std::size_t size) override;

    // Drives curl until body bytes are buffered or the transfer has ended.
    void waitForData();
    void throwIfFailed() const;
    [[nodiscard]] bool hasBufferedData() const noexcept { return read_offset_ < buffer_.size(); }
    [[nodiscard]] HttpResponse describe() const;

private:
    using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using MultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;
    using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    static size_t onBody(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t onHeader(char* ptr, size_t size, size_t nitems, void* userdata);

    void step();
    void complete();

    MultiHandle multi_{nullptr, &curl_multi_cleanup};
    EasyHandle easy_{nullptr, &curl_easy_cleanup};
    HeaderList header_list_{nullptr, &curl_slist_free_all};

    HttpHeaders headers_;
    std::string buffer_;
    std::size_t read_offset_{0};

    bool done_{false};
    CURLcode result_{CURLE_OK};
    long os_errno_{0};
    std::array<char, CURL_ERROR_SIZE> error_buffer_{};
};

CurlTransfer::CurlTransfer(const HttpRequest& request, const CurlHttpClient::Options& options) {
    multi_.reset(curl_multi_init());
    easy_.reset(curl_easy_init());
    if (!multi_ || !easy_) {
        throw TransportError("Failed to allocate curl handle");
    }

    for (const auto& [name, value] : request.headers) {
        const auto line = fmt::format("{}: {}", name, value);
        curl_slist* list = header_list_.release();
        curl_slist* appended = curl_slist_append(list, line.c_str());
        if (!appended) {
            curl_slist_free_all(list);
            throw std::bad_alloc();
        }
        header_list_.reset(appended);
    }

    CURL* easy = easy_.get();
    curl_easy_setopt(easy, CURLOPT_URL, request.url.c_str());
    if (request.method == "HEAD") {
        curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, header_list_.get());
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    curl_easy_setopt(easy, CURLOPT_LOW_SPEED_LIMIT, options.low_speed_limit);
    curl_easy_setopt(easy, CURLOPT_LOW_SPEED_TIME, options.low_speed_time_seconds);
    curl_easy_setopt(easy, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, error_buffer_.data());
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlTransfer::onBody);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &CurlTransfer::onHeader);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, this);

    const CURLMcode rc = curl_multi_add_handle(multi_.get(), easy);
    if (rc != CURLM_OK) {
        throw TransportError(fmt::format("curl multi error: {}", curl_multi_strerror(rc)));
    }
}

CurlTransfer::~CurlTransfer() {
    if (multi_ && easy_) {
        curl_multi_remove_handle(multi_.get(), easy_.get());
    }
}

size_t CurlTransfer::onBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlTransfer*>(userdata);
    const size_t total = size * nmemb;
    if (self->read_offset_ == self->buffer_.size()) {
        self->buffer_.clear();
        self->read_offset_ = 0;
    }
    self->buffer_.append(ptr, total);
    return total;
}

size_t CurlTransfer::onHeader(char* ptr, size_t size, size_t nitems, void* userdata) {
    auto* self = static_cast<CurlTransfer*>(userdata);
    const size_t total = size * nitems;
    const std::string_view line = trim(std::string_view{ptr, total});

    //每一跳重定向都会带来新的状态行, 只保留最后一组响应头
    if (line.rfind("HTTP/", 0) == 0) {
        self->headers_.clear();
    } else if (const auto colon = line.find(':'); colon != std::string_view::npos) {
        self->headers_.emplace_back(std::string{trim(line.substr(0, colon))},
                                    std::string{trim(line.substr(colon + 1))});
    }
    return total;
}

void CurlTransfer::step() {
    int running = 0;
    CURLMcode rc = curl_multi_perform(multi_.get(), &running);
    if (rc != CURLM_OK) {
        throw TransportError(fmt::format("curl multi error: {}", curl_multi_strerror(rc)));
    }
    if (running == 0) {
        complete();
        return;
    }
    if (!hasBufferedData()) {
        rc = curl_multi_poll(multi_.get(), nullptr, 0, kPollTimeoutMs, nullptr);
        if (rc != CURLM_OK) {
            throw TransportError(fmt::format("curl multi error: {}", curl_multi_strerror(rc)));
        }
    }
}

void CurlTransfer::complete() {
    int queued = 0;
    while (CURLMsg* message = curl_multi_info_read(multi_.get(), &queued)) {
        if (message->msg == CURLMSG_DONE && message->easy_handle == easy_.get()) {
            result_ = message->data.result;
        }
    }
    curl_easy_getinfo(easy_.get(), CURLINFO_OS_ERRNO, &os_errno_);
    done_ = true;
}

void CurlTransfer::waitForData() {
    while (!done_ && !hasBufferedData()) {
        step();
    }
}

void CurlTransfer::throwIfFailed() const {
    if (done_ && result_ != CURLE_OK) {
        detail::throwCurlError(result_, os_errno_, error_buffer_.data());
    }
}

std::size_t CurlTransfer::read(char* buffer, std::size_t size) {
    waitForData();
    if (hasBufferedData()) {
        const std::size_t count = std::min(size, buffer_.size() - read_offset_);
        std::memcpy(buffer, buffer_.data() + read_offset_, count);
        read_offset_ += count;
        return count;
    }

    throwIfFailed();
    return 0;
}

HttpResponse CurlTransfer::describe() const {
    HttpResponse response;
    curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &response.status_code);

    curl_off_t length = -1;
    curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    response.content_length = static_cast<std::int64_t>(length);

    char* effective_url = nullptr;
    if (curl_easy_getinfo(easy_.get(), CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK && effective_url) {
        response.resolved_url = effective_url;
    }

    response.headers = headers_;
    return response;
}

} // namespace

class CurlHttpClient::Impl {
public:
    explicit Impl(Options options) : options_(std::move(options)) {}

    HttpResponse execute(const HttpRequest& request) const {
        auto transfer = std::make_unique<CurlTransfer>(request, options_);
        transfer->waitForData();
        //还没收到任何数据就失败了, 直接作为请求错误抛出
        if (!transfer->hasBufferedData()) {
            transfer->throwIfFailed();
        }

        HttpResponse response = transfer->describe();
        if (request.method != "HEAD") {
            response.body = std::move(transfer);
        }
        return response;
    }

private:
    Options options_;
};

CurlHttpClient::CurlHttpClient() : CurlHttpClient(Options{}) {}

CurlHttpClient::CurlHttpClient(Options options) : impl_(std::make_unique<Impl>(std::move(options))) {
    detail::ensureCurlInitialized();
}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::execute(const HttpRequest& request) { return impl_->execute(request); }

} // namespace rangeget
