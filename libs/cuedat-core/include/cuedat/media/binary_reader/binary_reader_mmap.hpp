#pragma once

#include "binary_reader.hpp"

#include <mio/mmap.hpp>

#include <algorithm>
#include <filesystem>
#include <span>
#include <system_error>

namespace cuedat::media {

/// @brief `IBinaryReader` backed by a memory-mapped file.
///
/// Preferred for hashing and copying large track files. Mapping an empty file fails on some platforms; use
/// `FileBinaryReader` as a fallback.
class MemoryMappedBinaryReader final : public IBinaryReader {
public:
    MemoryMappedBinaryReader() = default;

    /// @brief Maps the specified file.
    ///
    /// On failure, the reader is left empty and `error` describes the problem.
    ///
    /// @param[in] path the file to map
    /// @param[out] error receives the error, or is cleared on success
    MemoryMappedBinaryReader(const std::filesystem::path &path, std::error_code &error) {
        error.clear();
        m_in = mio::make_mmap_source(path.native(), error);
    }

    MemoryMappedBinaryReader(const MemoryMappedBinaryReader &) = delete;
    MemoryMappedBinaryReader(MemoryMappedBinaryReader &&) = default;

    MemoryMappedBinaryReader &operator=(const MemoryMappedBinaryReader &) = delete;
    MemoryMappedBinaryReader &operator=(MemoryMappedBinaryReader &&) = default;

    uintmax_t Size() const final {
        return m_in.is_mapped() ? m_in.size() : 0;
    }

    uintmax_t Read(uintmax_t offset, uintmax_t size, std::span<uint8> output) const final {
        if (!m_in.is_mapped() || offset >= m_in.size()) {
            return 0;
        }
        size = std::min<uintmax_t>(size, m_in.size() - offset);
        size = std::min<uintmax_t>(size, output.size());
        std::copy_n(m_in.begin() + offset, size, reinterpret_cast<char *>(output.data()));
        return size;
    }

private:
    mio::mmap_source m_in;
};

} // namespace cuedat::media
