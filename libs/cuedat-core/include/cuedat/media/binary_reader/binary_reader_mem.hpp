#pragma once

#include "binary_reader.hpp"

#include <algorithm>
#include <span>
#include <vector>

namespace cuedat::media {

/// @brief `IBinaryReader` over an in-memory buffer.
class MemoryBinaryReader final : public IBinaryReader {
public:
    MemoryBinaryReader() = default;

    /// @brief Copies the provided data into the reader.
    explicit MemoryBinaryReader(std::span<const uint8> data)
        : m_data(data.begin(), data.end()) {}

    /// @brief Takes ownership of the vector.
    explicit MemoryBinaryReader(std::vector<uint8> &&data)
        : m_data(std::move(data)) {}

    uintmax_t Size() const final {
        return m_data.size();
    }

    uintmax_t Read(uintmax_t offset, uintmax_t size, std::span<uint8> output) const final {
        if (offset >= m_data.size()) {
            return 0;
        }
        size = std::min<uintmax_t>(size, m_data.size() - offset);
        size = std::min<uintmax_t>(size, output.size());
        std::copy_n(m_data.cbegin() + offset, size, output.begin());
        return size;
    }

private:
    std::vector<uint8> m_data;
};

} // namespace cuedat::media
