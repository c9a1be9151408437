#include <catch2/catch.hpp>
#include <splitfetch/detail/string_utils.hpp>

using namespace splitfetch::detail;

TEST_CASE("detail::trim", "[strings]") {
    CHECK(trim("  bytes\r\n") == "bytes");
    CHECK(trim("\tnone ") == "none");
    CHECK(trim("   ").empty());
    CHECK(trim("").empty());
}

TEST_CASE("detail::iequals and toLower", "[strings]") {
    CHECK(iequals("Bytes", "bytes"));
    CHECK(iequals("BYTES", "bytes"));
    CHECK_FALSE(iequals("bytes ", "bytes"));
    CHECK_FALSE(iequals("none", "bytes"));
    CHECK(toLower("Accept-Ranges") == "accept-ranges");
}
