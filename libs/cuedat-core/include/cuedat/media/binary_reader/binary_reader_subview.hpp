#pragma once

#include "binary_reader.hpp"

#include <algorithm>
#include <memory>

namespace cuedat::media {

/// @brief `IBinaryReader` over a window of another shared reader.
///
/// Used to expose a single track of a multi-track file.
class SharedSubviewBinaryReader final : public IBinaryReader {
public:
    /// @brief Views the entire contents of the reader.
    explicit SharedSubviewBinaryReader(std::shared_ptr<IBinaryReader> binaryReader)
        : m_reader(binaryReader)
        , m_offset(0)
        , m_size(binaryReader->Size()) {}

    /// @brief Views `size` bytes starting at `offset`.
    ///
    /// An out-of-range offset produces an empty view. The size is clamped to the end of the underlying data.
    SharedSubviewBinaryReader(std::shared_ptr<IBinaryReader> binaryReader, uintmax_t offset, uintmax_t size)
        : m_reader(binaryReader)
        , m_offset(std::min(offset, binaryReader->Size()))
        , m_size(std::min(size, binaryReader->Size() - m_offset)) {}

    uintmax_t Size() const final {
        return m_size;
    }

    uintmax_t Read(uintmax_t offset, uintmax_t size, std::span<uint8> output) const final {
        if (offset >= m_size) {
            return 0;
        }
        size = std::min(size, m_size - offset);
        size = std::min<uintmax_t>(size, output.size());
        return m_reader->Read(offset + m_offset, size, output);
    }

private:
    std::shared_ptr<IBinaryReader> m_reader;
    uintmax_t m_offset;
    uintmax_t m_size;
};

} // namespace cuedat::media
