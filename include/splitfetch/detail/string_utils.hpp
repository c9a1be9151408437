#pragma once

#include <string>
#include <string_view>

namespace splitfetch::detail {

[[nodiscard]] std::string_view trim(std::string_view value);
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs);
[[nodiscard]] std::string toLower(std::string_view value);

} // namespace splitfetch::detail
