#include "splitfetch/download_event.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace splitfetch {

namespace {

std::string formatRanges(const std::vector<ByteRange>& ranges) {
    std::string out;
    out.reserve(ranges.size() * 16);
    for (const auto& range : ranges) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += fmt::format("[{} {}]", range.start, range.end);
    }
    return out;
}

} // namespace

const char* toString(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::ProbeStarted:   return "probe-started";
        case EventKind::SizeDiscovered: return "size-discovered";
        case EventKind::RangesPlanned:  return "ranges-planned";
        case EventKind::ChunkStarted:   return "chunk-started";
        case EventKind::ChunkFinished:  return "chunk-finished";
        case EventKind::ChunkFailed:    return "chunk-failed";
        case EventKind::MergeStarted:   return "merge-started";
        case EventKind::Completed:      return "completed";
        case EventKind::Failed:         return "failed";
    }
    return "unknown";
}

EventSink makeLoggingSink(std::shared_ptr<spdlog::logger> logger) {
    if (!logger) {
        throw std::invalid_argument("logging sink requires a logger");
    }

    return [logger = std::move(logger)](const DownloadEvent& event) {
        switch (event.kind) {
            case EventKind::ProbeStarted:
                logger->info("Checking server support for range requests...");
                break;
            case EventKind::SizeDiscovered:
                logger->info("The size of the file is {} bytes", event.total_size);
                break;
            case EventKind::RangesPlanned:
                logger->info("The ranges are: {}", formatRanges(event.ranges));
                break;
            case EventKind::ChunkStarted:
                logger->info("Downloading {} range [{} {}]", event.range.index, event.range.start, event.range.end);
                break;
            case EventKind::ChunkFinished:
                logger->info("Finished downloading {}", event.range.index);
                break;
            case EventKind::ChunkFailed:
                logger->error("Error downloading {}: {}", event.range.index, event.message);
                break;
            case EventKind::MergeStarted:
                logger->info("Merging files...");
                break;
            case EventKind::Completed:
                logger->info("Download completed");
                break;
            case EventKind::Failed:
                logger->error("Download failed: {}", event.message);
                break;
        }
    };
}

} // namespace splitfetch
