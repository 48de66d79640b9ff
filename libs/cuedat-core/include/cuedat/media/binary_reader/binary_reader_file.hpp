#pragma once

#include "binary_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <span>
#include <system_error>

namespace cuedat::media {

/// @brief `IBinaryReader` that reads from a file through a stream.
class FileBinaryReader final : public IBinaryReader {
public:
    /// @brief Creates a reader with no file; reads return nothing.
    FileBinaryReader() = default;

    /// @brief Opens the specified file.
    ///
    /// On failure, the reader is left empty and `error` describes the problem.
    ///
    /// @param[in] path the file to open
    /// @param[out] error receives the error, or is cleared on success
    FileBinaryReader(const std::filesystem::path &path, std::error_code &error) {
        error.clear();

        m_in = std::ifstream{path, std::ios::binary};
        if (!m_in) {
            error.assign(errno, std::generic_category());
            return;
        }

        m_size = std::filesystem::file_size(path, error);
        if (error) {
            m_in.close();
            m_size = 0;
        }
    }

    FileBinaryReader(const FileBinaryReader &) = delete;
    FileBinaryReader(FileBinaryReader &&) = default;

    FileBinaryReader &operator=(const FileBinaryReader &) = delete;
    FileBinaryReader &operator=(FileBinaryReader &&) = default;

    uintmax_t Size() const final {
        return m_size;
    }

    uintmax_t Read(uintmax_t offset, uintmax_t size, std::span<uint8> output) const final {
        if (offset >= m_size) {
            return 0;
        }
        size = std::min(size, m_size - offset);
        size = std::min<uintmax_t>(size, output.size());
        m_in.clear();
        m_in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        m_in.read(reinterpret_cast<char *>(output.data()), static_cast<std::streamsize>(size));
        return static_cast<uintmax_t>(m_in.gcount());
    }

private:
    mutable std::ifstream m_in;
    uintmax_t m_size = 0;
};

} // namespace cuedat::media
