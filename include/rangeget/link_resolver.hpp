#pragma once

#include <string>
#include <utility>

namespace rangeget {

// Produces the URL to download from, e.g. a freshly signed link.
class LinkResolver {
public:
    virtual ~LinkResolver() = default;

    // Throws when no link can be produced.
    virtual std::string resolve() = 0;
};

class StaticLinkResolver final : public LinkResolver {
public:
    explicit StaticLinkResolver(std::string url) : url_(std::move(url)) {}

    std::string resolve() override { return url_; }

private:
    std::string url_;
};

} // namespace rangeget
