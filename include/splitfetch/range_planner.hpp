#pragma once

#include "byte_range.hpp"

#include <cstdint>
#include <vector>

namespace splitfetch {

[[nodiscard]] std::vector<ByteRange> planRanges(std::int64_t total_size, int worker_count);

} // namespace splitfetch
