#pragma once

/**
@file
@brief SHA-1 and CRC-32 hashing types and functions.

These are the digests used by Logiqx/Redump DAT files to identify ROMs.
*/

#include <cuedat/core/types.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>

namespace cuedat::media {
class IBinaryReader;
} // namespace cuedat::media

namespace cuedat {

/// @brief Canonical (big-endian) representation of a SHA-1 digest.
using SHA1Hash = std::array<uint8, 20>;

/// @brief Incremental SHA-1 hasher.
class SHA1 {
public:
    SHA1();

    /// @brief Feeds more data into the hash.
    /// @param[in] data the data to hash
    void Update(std::span<const uint8> data);

    /// @brief Completes the hash and resets the hasher so it can be reused.
    /// @return the digest of all data fed since construction or the previous call
    SHA1Hash Final();

private:
    void Reset();
    void ProcessBlock(const uint8 *block);

    std::array<uint32, 5> m_state;
    std::array<uint8, 64> m_block;
    size_t m_blockLen;
    uint64 m_totalLen;
};

/// @brief Incremental CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320) hasher.
class CRC32 {
public:
    /// @brief Feeds more data into the checksum.
    /// @param[in] data the data to checksum
    void Update(std::span<const uint8> data);

    /// @brief Retrieves the checksum of all data fed so far.
    uint32 Value() const {
        return ~m_crc;
    }

private:
    uint32 m_crc = 0xFFFFFFFF;
};

/// @brief Calculates the SHA-1 digest of the input.
/// @param[in] input the input data
/// @param[in] len the length of the input data
/// @return the digest of the input
SHA1Hash CalcSHA1(const void *input, size_t len);

/// @brief Calculates the CRC-32 checksum of the input.
/// @param[in] input the input data
/// @param[in] len the length of the input data
/// @return the checksum of the input
uint32 CalcCRC32(const void *input, size_t len);

/// @brief Converts a `SHA1Hash` into a string.
/// @param[in] hash the hash
/// @return the hash as a 40-character string of lowercase hex digits, as written in DAT files
std::string ToString(const SHA1Hash &hash);

/// @brief Size and digests of a file.
struct FileDigest {
    uintmax_t size = 0;
    std::string sha1; ///< Lowercase hex SHA-1
    uint32 crc32 = 0;
};

/// @brief Hashes the entire contents of a reader.
/// @param[in] reader the data to hash
/// @return the digest of the data
FileDigest HashReader(const media::IBinaryReader &reader);

/// @brief Hashes a file.
/// @param[in] path the file to hash
/// @param[out] digest receives the digest on success
/// @param[out] error receives the error, or is cleared on success
/// @return `true` if the file was hashed successfully
bool HashFile(const std::filesystem::path &path, FileDigest &digest, std::error_code &error);

} // namespace cuedat
