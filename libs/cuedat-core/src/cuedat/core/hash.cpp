#include <cuedat/core/hash.hpp>

#include <cuedat/media/binary_reader/binary_reader_impl.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <iterator>
#include <memory>

namespace cuedat {

// -----------------------------------------------------------------------------
// SHA-1

SHA1::SHA1() {
    Reset();
}

void SHA1::Reset() {
    m_state = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};
    m_block.fill(0);
    m_blockLen = 0;
    m_totalLen = 0;
}

void SHA1::ProcessBlock(const uint8 *block) {
    std::array<uint32, 80> w{};

    // Sixteen big-endian words, extended to eighty
    for (size_t i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32>(block[i * 4 + 0]) << 24u) | (static_cast<uint32>(block[i * 4 + 1]) << 16u) |
               (static_cast<uint32>(block[i * 4 + 2]) << 8u) | static_cast<uint32>(block[i * 4 + 3]);
    }
    for (size_t i = 16; i < 80; i++) {
        w[i] = std::rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32 a = m_state[0];
    uint32 b = m_state[1];
    uint32 c = m_state[2];
    uint32 d = m_state[3];
    uint32 e = m_state[4];

    for (size_t i = 0; i < 80; i++) {
        uint32 f;
        uint32 k;
        if (i < 20) {
            f = (b & c) | (~b & d);
            k = 0x5A827999;
        } else if (i < 40) {
            f = b ^ c ^ d;
            k = 0x6ED9EBA1;
        } else if (i < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8F1BBCDC;
        } else {
            f = b ^ c ^ d;
            k = 0xCA62C1D6;
        }

        const uint32 temp = std::rotl(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = std::rotl(b, 30);
        b = a;
        a = temp;
    }

    m_state[0] += a;
    m_state[1] += b;
    m_state[2] += c;
    m_state[3] += d;
    m_state[4] += e;
}

void SHA1::Update(std::span<const uint8> data) {
    m_totalLen += data.size();

    // Complete a pending partial block first
    if (m_blockLen > 0) {
        const size_t count = std::min(m_block.size() - m_blockLen, data.size());
        std::copy_n(data.begin(), count, m_block.begin() + m_blockLen);
        m_blockLen += count;
        data = data.subspan(count);
        if (m_blockLen < m_block.size()) {
            return;
        }
        ProcessBlock(m_block.data());
        m_blockLen = 0;
    }

    while (data.size() >= m_block.size()) {
        ProcessBlock(data.data());
        data = data.subspan(m_block.size());
    }

    std::copy(data.begin(), data.end(), m_block.begin());
    m_blockLen = data.size();
}

SHA1Hash SHA1::Final() {
    const uint64 bitLen = m_totalLen * 8;

    m_block[m_blockLen++] = 0x80;
    if (m_blockLen > m_block.size() - sizeof(uint64)) {
        // No room for the length; pad out this block and use another one
        std::fill(m_block.begin() + m_blockLen, m_block.end(), 0);
        ProcessBlock(m_block.data());
        m_blockLen = 0;
    }
    std::fill(m_block.begin() + m_blockLen, m_block.end() - sizeof(uint64), 0);
    for (size_t i = 0; i < sizeof(uint64); i++) {
        m_block[m_block.size() - 1 - i] = static_cast<uint8>(bitLen >> (i * 8u));
    }
    ProcessBlock(m_block.data());

    SHA1Hash out{};
    for (size_t i = 0; i < m_state.size(); i++) {
        out[i * 4 + 0] = static_cast<uint8>(m_state[i] >> 24u);
        out[i * 4 + 1] = static_cast<uint8>(m_state[i] >> 16u);
        out[i * 4 + 2] = static_cast<uint8>(m_state[i] >> 8u);
        out[i * 4 + 3] = static_cast<uint8>(m_state[i]);
    }

    Reset();
    return out;
}

SHA1Hash CalcSHA1(const void *input, size_t len) {
    SHA1 sha1{};
    sha1.Update({static_cast<const uint8 *>(input), len});
    return sha1.Final();
}

std::string ToString(const SHA1Hash &hash) {
    fmt::memory_buffer buf{};
    auto inserter = std::back_inserter(buf);
    for (uint8 b : hash) {
        fmt::format_to(inserter, "{:02x}", b);
    }
    return fmt::to_string(buf);
}

// -----------------------------------------------------------------------------
// CRC-32

static constexpr auto kCRC32Table = [] {
    std::array<uint32, 256> crcTable{};
    for (uint32 i = 0; i < 256; ++i) {
        uint32 c = i;
        for (uint32 j = 0; j < 8; ++j) {
            c = (c >> 1) ^ ((c & 0x1) ? 0xEDB88320 : 0);
        }
        crcTable[i] = c;
    }
    return crcTable;
}();

void CRC32::Update(std::span<const uint8> data) {
    uint32 crc = m_crc;
    for (uint8 b : data) {
        crc = (crc >> 8) ^ kCRC32Table[(crc ^ b) & 0xFF];
    }
    m_crc = crc;
}

uint32 CalcCRC32(const void *input, size_t len) {
    CRC32 crc{};
    crc.Update({static_cast<const uint8 *>(input), len});
    return crc.Value();
}

// -----------------------------------------------------------------------------
// Files

FileDigest HashReader(const media::IBinaryReader &reader) {
    static constexpr size_t kChunkSize = 1024 * 1024;
    auto buffer = std::make_unique<std::array<uint8, kChunkSize>>();

    SHA1 sha1{};
    CRC32 crc{};
    uintmax_t offset = 0;
    while (offset < reader.Size()) {
        const uintmax_t read = reader.Read(offset, kChunkSize, *buffer);
        if (read == 0) {
            break;
        }
        const std::span<const uint8> chunk{buffer->data(), static_cast<size_t>(read)};
        sha1.Update(chunk);
        crc.Update(chunk);
        offset += read;
    }

    return {.size = offset, .sha1 = ToString(sha1.Final()), .crc32 = crc.Value()};
}

bool HashFile(const std::filesystem::path &path, FileDigest &digest, std::error_code &error) {
    auto reader = media::OpenBinaryReader(path, error);
    if (!reader) {
        return false;
    }
    digest = HashReader(*reader);
    if (digest.size != reader->Size()) {
        error = std::make_error_code(std::errc::io_error);
        return false;
    }
    return true;
}

} // namespace cuedat
