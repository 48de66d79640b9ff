#pragma once

#include <cuedat/core/hash.hpp>
#include <cuedat/core/types.hpp>

#include <filesystem>
#include <span>
#include <system_error>
#include <vector>

namespace app {

struct HashedFile {
    std::filesystem::path path;
    cuedat::FileDigest digest;
    std::error_code error; // set if the file could not be hashed
};

// Hashes every file, running up to threadCount hashes at a time (0 = one per hardware thread).
// Returns once all files are done; results are in the same order as paths.
std::vector<HashedFile> HashFiles(std::span<const std::filesystem::path> paths, uint32 threadCount);

} // namespace app
