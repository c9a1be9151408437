#pragma once

#include <cstddef>
#include <filesystem>

namespace splitfetch {

// Not removed on destruction; release() once the pieces are merged.
class ScratchSpace {
public:
    // Empty root: system temp directory.
    static ScratchSpace create(const std::filesystem::path& root = {});

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }
    [[nodiscard]] std::filesystem::path piecePath(std::size_t index) const;

    void release() const;

private:
    explicit ScratchSpace(std::filesystem::path directory);

    std::filesystem::path directory_;
};

} // namespace splitfetch
