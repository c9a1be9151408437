#include <catch2/catch.hpp>
#include <splitfetch/chunk_fetcher.hpp>
#include <splitfetch/errors.hpp>

#include "test_support.hpp"

#include <memory>

using namespace splitfetch;
using namespace splitfetch::testing;

TEST_CASE("ChunkFetcher - successful fetch", "[fetcher]") {
    TempDir dir;
    const std::string content = makeContent(100);
    auto client = std::make_shared<FakeHttpClient>(content);
    const ChunkFetcher fetcher(client);

    SECTION("Middle range") {
        const ByteRange range{1, 25, 49};
        const auto piece = dir / "1";
        CHECK(fetcher.fetch("http://example.com/f", range, piece) == 25);
        CHECK(readFile(piece) == content.substr(25, 25));
        REQUIRE(client->rangeHeaders().size() == 1);
        CHECK(client->rangeHeaders()[0] == "bytes=25-49");
    }

    SECTION("Existing piece is truncated") {
        const auto piece = dir / "0";
        writeFile(piece, std::string(500, 'x'));
        CHECK(fetcher.fetch("http://example.com/f", ByteRange{0, 0, 9}, piece) == 10);
        CHECK(readFile(piece) == content.substr(0, 10));
    }

    SECTION("Empty range writes an empty piece without a request") {
        const auto piece = dir / "3";
        CHECK(fetcher.fetch("http://example.com/f", ByteRange{3, 0, -1}, piece) == 0);
        CHECK(fs::exists(piece));
        CHECK(fs::file_size(piece) == 0);
        CHECK(client->get_calls.load() == 0);
    }
}

TEST_CASE("ChunkFetcher - failures remove the piece", "[fetcher]") {
    TempDir dir;
    auto client = std::make_shared<FakeHttpClient>(makeContent(100));
    const ChunkFetcher fetcher(client);
    const auto piece = dir / "2";
    const ByteRange range{2, 50, 74};

    SECTION("Connection failure") {
        client->failing_indexes.insert(2);
        try {
            fetcher.fetch("http://example.com/f", range, piece);
            FAIL("expected ChunkFetchError");
        } catch (const ChunkFetchError& ex) {
            CHECK(ex.index() == 2);
            CHECK_THAT(std::string(ex.what()), Catch::Contains("reset"));
        }
        CHECK_FALSE(fs::exists(piece));
    }

    SECTION("Error status") {
        client->range_status = 503;
        CHECK_THROWS_WITH(fetcher.fetch("http://example.com/f", range, piece), Catch::Contains("503"));
        CHECK_FALSE(fs::exists(piece));
    }

    SECTION("Short body") {
        client->short_by = 3;
        CHECK_THROWS_WITH(fetcher.fetch("http://example.com/f", range, piece), Catch::Contains("incomplete"));
        CHECK_FALSE(fs::exists(piece));
    }

    SECTION("Whole body instead of the range stops early") {
        client->ignore_range = true;
        CHECK_THROWS_WITH(fetcher.fetch("http://example.com/f", range, piece), Catch::Contains("ignored the range"));
        CHECK_FALSE(fs::exists(piece));
        // Transfer aborted at the first slice that overflows the 25-byte span.
        CHECK(client->bytes_served.load() <= range.length());
    }

    SECTION("Scratch piece cannot be created") {
        CHECK_THROWS_AS(fetcher.fetch("http://example.com/f", range, dir / "missing" / "2"), ChunkFetchError);
        CHECK(client->get_calls.load() == 0);
    }
}
