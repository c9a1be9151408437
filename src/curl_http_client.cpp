#include "splitfetch/curl_http_client.hpp"

#include "splitfetch/config.hpp"
#include "splitfetch/detail/curl_utils.hpp"
#include "splitfetch/detail/string_utils.hpp"
#include "splitfetch/errors.hpp"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace splitfetch {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderMap = std::map<std::string, std::string>;

// Keeps the headers of the last response only, so a redirect hop does not
// leak its headers into the final answer.
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* headers = static_cast<HeaderMap*>(userdata);
    if (!headers) {
        return total;
    }

    const std::string_view line(buffer, total);
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return total;
    }

    (*headers)[detail::toLower(detail::trim(line.substr(0, colon)))] = std::string{detail::trim(line.substr(colon + 1))};
    return total;
}

size_t bodyCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto* writer = static_cast<const BodyWriter*>(userdata);
    const size_t total = size * nmemb;
    if (!writer || !*writer) {
        return 0;
    }
    return (*writer)(ptr, total) ? total : 0;
}

CurlHandle makeHandle(const std::string& url, const std::string& user_agent) {
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransportError("Failed to allocate curl handle");
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
    return curl;
}

} // namespace

CurlHttpClient::CurlHttpClient()
    : user_agent_(fmt::format("splitfetch/{}", kVersion)) {
    detail::ensureCurlInitialized();
}

HeadResponse CurlHttpClient::head(const std::string& url) {
    CurlHandle curl = makeHandle(url, user_agent_);

    HeaderMap headers;
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError(fmt::format("curl error: {}", curl_easy_strerror(res)));
    }

    HeadResponse response;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);

    curl_off_t length = -1;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
        response.content_length = static_cast<std::int64_t>(length);
    } else if (const auto it = headers.find("content-length"); it != headers.end()) {
        try {
            response.content_length = std::stoll(it->second);
        } catch (const std::exception&) {
            response.content_length.reset();
        }
    }

    if (const auto it = headers.find("accept-ranges"); it != headers.end()) {
        response.accept_ranges = it->second;
    }
    return response;
}

long CurlHttpClient::getRange(const std::string& url, const ByteRange& range, const BodyWriter& writer) {
    CurlHandle curl = makeHandle(url, user_agent_);

    const std::string range_value = detail::formatCurlRange(range.start, range.end);
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range_value.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &bodyCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &writer);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

    const CURLcode res = curl_easy_perform(curl.get());

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (res == CURLE_HTTP_RETURNED_ERROR) {
        return code;
    }
    if (res != CURLE_OK) {
        throw TransportError(fmt::format("curl error: {}", curl_easy_strerror(res)));
    }
    return code;
}

} // namespace splitfetch
