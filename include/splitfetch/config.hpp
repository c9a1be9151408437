#pragma once

#include <cstddef>
#include <string>

namespace splitfetch {

constexpr const char* kVersion = "0.3.1";

constexpr int kDefaultConcurrency = 10;
constexpr long kMaxRedirects = 10;
constexpr const char* kScratchDirPrefix = "splitfetch-";

struct DownloadOptions {
    std::string url;
    std::string destination;
    int concurrency{kDefaultConcurrency};
    // 0 = unbounded
    std::size_t max_parallel{0};
    std::string scratch_root;
};

} // namespace splitfetch
