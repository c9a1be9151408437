#pragma once

#include "scratch_space.hpp"

#include <cstddef>
#include <filesystem>

namespace splitfetch {

// A partially written destination is left in place on MergeError.
void mergePieces(const ScratchSpace& scratch, std::size_t piece_count, const std::filesystem::path& destination);

} // namespace splitfetch
