#include "splitfetch/merger.hpp"

#include "splitfetch/detail/file_handle.hpp"
#include "splitfetch/errors.hpp"

#include <cstdio>
#include <system_error>
#include <vector>

#include <fmt/format.h>

namespace splitfetch {

namespace {

constexpr std::size_t kCopyBufferSize = 256 * 1024;

using detail::FilePtr;

void appendPiece(FILE* out, FILE* in, std::vector<char>& buffer, std::size_t index) {
    while (true) {
        const std::size_t n = std::fread(buffer.data(), 1, buffer.size(), in);
        if (n > 0 && std::fwrite(buffer.data(), 1, n, out) != n) {
            throw MergeError(fmt::format("Failed to write piece {} to destination", index));
        }
        if (n < buffer.size()) {
            if (std::ferror(in)) {
                throw MergeError(fmt::format("Failed to read scratch piece {}", index));
            }
            return;
        }
    }
}

} // namespace

void mergePieces(const ScratchSpace& scratch, std::size_t piece_count, const std::filesystem::path& destination) {
    FilePtr out{std::fopen(destination.c_str(), "wb")};
    if (!out) {
        throw MergeError(fmt::format("Cannot create destination file {}", destination.string()));
    }

    std::vector<char> buffer(kCopyBufferSize);
    for (std::size_t i = 0; i < piece_count; ++i) {
        const auto piece = scratch.piecePath(i);
        {
            FilePtr in{std::fopen(piece.c_str(), "rb")};
            if (!in) {
                throw MergeError(fmt::format("Cannot open scratch piece {} ({})", i, piece.string()));
            }
            appendPiece(out.get(), in.get(), buffer, i);
        }

        std::error_code ec;
        std::filesystem::remove(piece, ec);
        if (ec) {
            throw MergeError(fmt::format("Cannot remove scratch piece {}: {}", piece.string(), ec.message()));
        }
    }

    if (std::fclose(out.release()) != 0) {
        throw MergeError(fmt::format("Failed to flush destination file {}", destination.string()));
    }

    try {
        scratch.release();
    } catch (const std::filesystem::filesystem_error& ex) {
        throw MergeError(fmt::format("Cannot remove scratch directory: {}", ex.what()));
    }
}

} // namespace splitfetch
