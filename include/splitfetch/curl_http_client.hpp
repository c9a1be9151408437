#pragma once

#include "http_client.hpp"

#include <string>

namespace splitfetch {

class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();

    [[nodiscard]] HeadResponse head(const std::string& url) override;
    long getRange(const std::string& url, const ByteRange& range, const BodyWriter& writer) override;

private:
    std::string user_agent_;
};

} // namespace splitfetch
