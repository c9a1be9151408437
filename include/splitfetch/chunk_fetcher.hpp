#pragma once

#include "byte_range.hpp"
#include "http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace splitfetch {

class ChunkFetcher {
public:
    explicit ChunkFetcher(HttpClientPtr client);

    // The piece is removed before ChunkFetchError is thrown.
    std::int64_t fetch(const std::string& url, const ByteRange& range, const std::filesystem::path& piece) const;

private:
    HttpClientPtr client_;
};

} // namespace splitfetch
