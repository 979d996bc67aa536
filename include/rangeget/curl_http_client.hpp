#pragma once

#include "http.hpp"

#include <memory>
#include <string>

namespace rangeget {

class CurlHttpClient final : public HttpClient {
public:
    struct Options {
        long connect_timeout_seconds{30};
        // A transfer slower than low_speed_limit bytes/s for low_speed_time
        // seconds is aborted as timed out.
        long low_speed_limit{1};
        long low_speed_time_seconds{60};
        long max_redirects{10};
        std::string user_agent{"rangeget/1.0"};
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options options);
    ~CurlHttpClient() override;

    HttpResponse execute(const HttpRequest& request) override;

private:
    //使用impl类隐藏 libcurl 头文件
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangeget
