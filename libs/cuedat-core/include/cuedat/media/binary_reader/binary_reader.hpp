#pragma once

/**
@file
@brief Random-access reader abstraction over track data.
*/

#include <cuedat/core/types.hpp>

#include <cstdint>
#include <span>

namespace cuedat::media {

/// @brief Read-only random access to a blob of bytes, typically the contents of a track file.
class IBinaryReader {
public:
    virtual ~IBinaryReader() = default;

    /// @brief Returns the size of the data in bytes.
    virtual uintmax_t Size() const = 0;

    /// @brief Reads up to `size` bytes starting at `offset` into `output`.
    ///
    /// The amount read is limited by `output.size()` and by the data available past `offset`. If fewer bytes than
    /// `output.size()` are read, the rest of the buffer is left untouched.
    ///
    /// @param[in] offset the offset of the first byte to read
    /// @param[in] size the number of bytes to read
    /// @param[out] output the buffer that receives the bytes
    /// @return the number of bytes actually read
    virtual uintmax_t Read(uintmax_t offset, uintmax_t size, std::span<uint8> output) const = 0;
};

} // namespace cuedat::media
