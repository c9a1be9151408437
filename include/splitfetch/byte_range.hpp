#pragma once

#include <cstddef>
#include <cstdint>

namespace splitfetch {

// end is inclusive; end < start means empty.
struct ByteRange {
    std::size_t index{0};
    std::int64_t start{0};
    std::int64_t end{-1};

    [[nodiscard]] std::int64_t length() const noexcept { return end - start + 1; }
    [[nodiscard]] bool empty() const noexcept { return length() <= 0; }
};

inline bool operator==(const ByteRange& lhs, const ByteRange& rhs) noexcept {
    return lhs.index == rhs.index && lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const ByteRange& lhs, const ByteRange& rhs) noexcept {
    return !(lhs == rhs);
}

} // namespace splitfetch
