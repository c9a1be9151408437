#pragma once

#include <string>

namespace splitfetch::detail {

void ensureCurlInitialized();

[[nodiscard]] std::string formatCurlRange(long long start, long long end);

} // namespace splitfetch::detail
