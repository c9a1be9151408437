#include "splitfetch/scratch_space.hpp"

#include "splitfetch/config.hpp"

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace splitfetch {

namespace fs = std::filesystem;

ScratchSpace::ScratchSpace(fs::path directory)
    : directory_(std::move(directory)) {}

ScratchSpace ScratchSpace::create(const fs::path& root) {
    const fs::path parent = root.empty() ? fs::temp_directory_path() : root;

    std::string pattern = (parent / (std::string{kScratchDirPrefix} + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        throw fs::filesystem_error("Cannot create scratch directory", parent,
                                   std::error_code(errno, std::generic_category()));
    }
    return ScratchSpace(fs::path(buffer.data()));
}

fs::path ScratchSpace::piecePath(std::size_t index) const {
    return directory_ / std::to_string(index);
}

void ScratchSpace::release() const {
    fs::remove(directory_);
}

} // namespace splitfetch
