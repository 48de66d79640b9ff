#pragma once

// This header file includes all implementations of IBinaryReader for ease of use.

#include "binary_reader_file.hpp"
#include "binary_reader_mem.hpp"
#include "binary_reader_mmap.hpp"
#include "binary_reader_subview.hpp"

#include <filesystem>
#include <memory>
#include <system_error>

namespace cuedat::media {

/// @brief Opens a track file with the most suitable reader.
///
/// Non-empty files are memory-mapped; empty files, which cannot be mapped, are opened as plain streams.
///
/// @param[in] path the file to open
/// @param[out] error receives the error, or is cleared on success
/// @return the reader, or `nullptr` on failure
inline std::shared_ptr<IBinaryReader> OpenBinaryReader(const std::filesystem::path &path, std::error_code &error) {
    const uintmax_t size = std::filesystem::file_size(path, error);
    if (error) {
        return nullptr;
    }

    std::shared_ptr<IBinaryReader> reader{};
    if (size == 0) {
        reader = std::make_shared<FileBinaryReader>(path, error);
    } else {
        reader = std::make_shared<MemoryMappedBinaryReader>(path, error);
    }
    if (error) {
        return nullptr;
    }
    return reader;
}

} // namespace cuedat::media
