#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace splitfetch {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RangeUnsupportedError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class ChunkFetchError : public DownloadError {
public:
    ChunkFetchError(std::size_t index, const std::string& message)
        : DownloadError(message), index_(index) {}

    [[nodiscard]] std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};

class MergeError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class TransportError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace splitfetch
