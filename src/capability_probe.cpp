#include "splitfetch/capability_probe.hpp"

#include "splitfetch/detail/string_utils.hpp"
#include "splitfetch/errors.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace splitfetch {

CapabilityProbe::CapabilityProbe(HttpClientPtr client)
    : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("CapabilityProbe requires an HTTP client");
    }
}

ProbeResult CapabilityProbe::probe(const std::string& url) const {
    HeadResponse response;
    try {
        response = client_->head(url);
    } catch (const TransportError& ex) {
        throw RangeUnsupportedError(fmt::format("probe of {} failed: {}", url, ex.what()));
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        throw RangeUnsupportedError(fmt::format("server answered probe with HTTP {}", response.status_code));
    }
    if (!detail::iequals(detail::trim(response.accept_ranges), "bytes")) {
        throw RangeUnsupportedError("server does not support range requests");
    }
    if (!response.content_length || *response.content_length < 0) {
        throw RangeUnsupportedError("server did not declare a content length");
    }

    return {*response.content_length, true};
}

} // namespace splitfetch
