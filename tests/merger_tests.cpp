#include <catch2/catch.hpp>
#include <splitfetch/errors.hpp>
#include <splitfetch/merger.hpp>
#include <splitfetch/scratch_space.hpp>

#include "test_support.hpp"

using namespace splitfetch;
using namespace splitfetch::testing;

TEST_CASE("ScratchSpace - per-job directories", "[scratch]") {
    TempDir root;

    const auto first = ScratchSpace::create(root.path());
    const auto second = ScratchSpace::create(root.path());

    CHECK(fs::is_directory(first.directory()));
    CHECK(first.directory().parent_path() == root.path());
    CHECK(first.directory().filename().string().rfind("splitfetch-", 0) == 0);
    CHECK(first.directory() != second.directory());
    CHECK(first.piecePath(7) == first.directory() / "7");

    first.release();
    CHECK_FALSE(fs::exists(first.directory()));
    CHECK(fs::exists(second.directory()));

    CHECK_THROWS_AS(ScratchSpace::create(root / "does-not-exist"), fs::filesystem_error);
}

TEST_CASE("mergePieces - concatenates in index order", "[merge]") {
    TempDir root;
    const auto scratch = ScratchSpace::create(root.path());
    writeFile(scratch.piecePath(0), "alpha-");
    writeFile(scratch.piecePath(1), "");
    writeFile(scratch.piecePath(2), "beta-");
    writeFile(scratch.piecePath(3), "gamma");

    const auto destination = root / "out.bin";
    writeFile(destination, "stale contents that must disappear");

    mergePieces(scratch, 4, destination);

    CHECK(readFile(destination) == "alpha-beta-gamma");
    CHECK_FALSE(fs::exists(scratch.directory()));
}

TEST_CASE("mergePieces - large pieces", "[merge]") {
    TempDir root;
    const auto scratch = ScratchSpace::create(root.path());
    const std::string content = makeContent(700 * 1024);
    writeFile(scratch.piecePath(0), content.substr(0, 300 * 1024));
    writeFile(scratch.piecePath(1), content.substr(300 * 1024));

    mergePieces(scratch, 2, root / "big.bin");
    CHECK(readFile(root / "big.bin") == content);
}

TEST_CASE("mergePieces - failures", "[merge]") {
    TempDir root;
    const auto scratch = ScratchSpace::create(root.path());

    SECTION("Missing piece stops the merge") {
        writeFile(scratch.piecePath(0), "first");
        writeFile(scratch.piecePath(2), "third");
        const auto destination = root / "partial.bin";

        CHECK_THROWS_WITH(mergePieces(scratch, 3, destination), Catch::Contains("piece 1"));

        // Partial output and the unmerged pieces stay behind.
        CHECK(readFile(destination) == "first");
        CHECK_FALSE(fs::exists(scratch.piecePath(0)));
        CHECK(fs::exists(scratch.piecePath(2)));
    }

    SECTION("Destination cannot be created") {
        writeFile(scratch.piecePath(0), "data");
        CHECK_THROWS_AS(mergePieces(scratch, 1, root / "no-such-dir" / "out.bin"), MergeError);
        CHECK(fs::exists(scratch.piecePath(0)));
    }
}
