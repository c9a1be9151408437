#include "splitfetch/chunk_fetcher.hpp"

#include "splitfetch/detail/file_handle.hpp"
#include "splitfetch/errors.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace splitfetch {

namespace {

using detail::FilePtr;

[[noreturn]] void discardAndThrow(FilePtr& file, const std::filesystem::path& piece,
                                  std::size_t index, std::string message) {
    file.reset();
    std::error_code ec;
    std::filesystem::remove(piece, ec);
    if (ec) {
        message += fmt::format(" (scratch piece {} left behind: {})", piece.string(), ec.message());
    }
    throw ChunkFetchError(index, message);
}

} // namespace

ChunkFetcher::ChunkFetcher(HttpClientPtr client)
    : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("ChunkFetcher requires an HTTP client");
    }
}

std::int64_t ChunkFetcher::fetch(const std::string& url, const ByteRange& range,
                                 const std::filesystem::path& piece) const {
    FilePtr file{std::fopen(piece.c_str(), "wb")};
    if (!file) {
        throw ChunkFetchError(range.index, fmt::format("Cannot create scratch piece {}", piece.string()));
    }

    if (range.empty()) {
        if (std::fclose(file.release()) != 0) {
            discardAndThrow(file, piece, range.index, "Failed to close scratch piece");
        }
        return 0;
    }

    std::int64_t written = 0;
    bool write_failed = false;
    bool overrun = false;
    // A server that ignores Range answers with the whole resource; stop as
    // soon as the body no longer fits the requested span.
    const BodyWriter writer = [&](const char* data, std::size_t size) {
        if (written + static_cast<std::int64_t>(size) > range.length()) {
            overrun = true;
            return false;
        }
        if (std::fwrite(data, 1, size, file.get()) != size) {
            write_failed = true;
            return false;
        }
        written += static_cast<std::int64_t>(size);
        return true;
    };

    long status = 0;
    try {
        status = client_->getRange(url, range, writer);
    } catch (const TransportError& ex) {
        if (overrun) {
            discardAndThrow(file, piece, range.index,
                            fmt::format("Server ignored the range: more than {} bytes received", range.length()));
        }
        discardAndThrow(file, piece, range.index,
                        write_failed ? std::string{"Failed to write scratch piece"} : std::string{ex.what()});
    }

    if (overrun) {
        discardAndThrow(file, piece, range.index,
                        fmt::format("Server ignored the range: more than {} bytes received", range.length()));
    }
    if (write_failed) {
        discardAndThrow(file, piece, range.index, "Failed to write scratch piece");
    }
    if (status < 200 || status >= 300) {
        discardAndThrow(file, piece, range.index, fmt::format("HTTP status {}", status));
    }
    if (std::fclose(file.release()) != 0) {
        discardAndThrow(file, piece, range.index, "Failed to flush scratch piece");
    }
    if (written != range.length()) {
        discardAndThrow(file, piece, range.index,
                        fmt::format("Range download incomplete: expected {} bytes, got {}", range.length(), written));
    }
    return written;
}

} // namespace splitfetch
