#include "splitfetch/detail/curl_utils.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <stdexcept>
#include <mutex>

#include <fmt/format.h>

namespace splitfetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(rc)));
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::string formatCurlRange(long long start, long long end) {
    return fmt::format("{}-{}", start, end);
}

} // namespace splitfetch::detail
