#pragma once

#include "byte_range.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace splitfetch {

enum class EventKind {
    ProbeStarted,
    SizeDiscovered,
    RangesPlanned,
    ChunkStarted,
    ChunkFinished,
    ChunkFailed,
    MergeStarted,
    Completed,
    Failed,
};

struct DownloadEvent {
    EventKind kind{EventKind::ProbeStarted};
    std::int64_t total_size{0};
    ByteRange range{};
    std::vector<ByteRange> ranges;
    std::string message;
};

// Never invoked concurrently.
using EventSink = std::function<void(const DownloadEvent&)>;

[[nodiscard]] const char* toString(EventKind kind) noexcept;

[[nodiscard]] EventSink makeLoggingSink(std::shared_ptr<spdlog::logger> logger);

} // namespace splitfetch
