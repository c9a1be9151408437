#include "splitfetch/range_planner.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace splitfetch {

std::vector<ByteRange> planRanges(std::int64_t total_size, int worker_count) {
    if (worker_count <= 0) {
        throw std::invalid_argument(fmt::format("worker count must be positive, got {}", worker_count));
    }
    if (total_size < 0) {
        throw std::invalid_argument(fmt::format("total size must not be negative, got {}", total_size));
    }

    const std::int64_t chunk_size = total_size / worker_count;

    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<std::size_t>(worker_count));
    for (int i = 0; i < worker_count; ++i) {
        ByteRange range;
        range.index = static_cast<std::size_t>(i);
        range.start = static_cast<std::int64_t>(i) * chunk_size;
        range.end = range.start + chunk_size - 1;
        if (i == worker_count - 1) {
            range.end = total_size - 1;
        }
        ranges.push_back(range);
    }
    return ranges;
}

} // namespace splitfetch
