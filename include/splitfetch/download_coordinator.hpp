#pragma once

#include "byte_range.hpp"
#include "config.hpp"
#include "download_event.hpp"
#include "http_client.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace splitfetch {

enum class JobState {
    Idle,
    Probing,
    Planning,
    Fetching,
    Merging,
    Done,
    Failed,
};

[[nodiscard]] const char* toString(JobState state) noexcept;

struct DownloadJob {
    std::string url;
    std::string destination;
    int worker_count{kDefaultConcurrency};
    std::int64_t total_size{0};
    std::vector<ByteRange> ranges;
};

struct ChunkResult {
    std::size_t index{0};
    bool ok{false};
    std::int64_t bytes_written{0};
    std::string error_message;
};

class DownloadCoordinator {
public:
    DownloadCoordinator(DownloadOptions options, HttpClientPtr client, EventSink sink = {});
    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    // May only be called once.
    void download();

    [[nodiscard]] JobState state() const;
    [[nodiscard]] DownloadJob job() const;
    [[nodiscard]] std::vector<ChunkResult> chunkResults() const;
    [[nodiscard]] std::filesystem::path scratchDirectory() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace splitfetch
