#pragma once

#include "byte_range.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace splitfetch {

struct HeadResponse {
    long status_code{0};
    std::optional<std::int64_t> content_length;
    std::string accept_ranges;
};

// Returning false aborts the transfer.
using BodyWriter = std::function<bool(const char* data, std::size_t size)>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual HeadResponse head(const std::string& url) = 0;

    // Returns the status code; an aborted writer surfaces as TransportError.
    virtual long getRange(const std::string& url, const ByteRange& range, const BodyWriter& writer) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace splitfetch
