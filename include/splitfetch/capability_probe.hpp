#pragma once

#include "http_client.hpp"

#include <cstdint>
#include <string>

namespace splitfetch {

struct ProbeResult {
    std::int64_t total_size{0};
    bool supports_ranges{false};
};

class CapabilityProbe {
public:
    explicit CapabilityProbe(HttpClientPtr client);

    [[nodiscard]] ProbeResult probe(const std::string& url) const;

private:
    HttpClientPtr client_;
};

} // namespace splitfetch
