#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <cuedat/core/hash.hpp>
#include <cuedat/media/binary_reader/binary_reader_mem.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace cuedat;

namespace hash_tests {

static std::span<const uint8> AsBytes(std::string_view text) {
    return {reinterpret_cast<const uint8 *>(text.data()), text.size()};
}

TEST_CASE("SHA-1 matches the FIPS 180 test vectors", "[core][hash]") {
    auto [input, expected] = GENERATE(table<std::string, std::string>({
        {"", "da39a3ee5e6b4b0d3255bfef95601890afd80709"},
        {"abc", "a9993e364706816aba3e25717850c26c9cd0d89d"},
        {"abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq", "84983e441c3bd26ebaae4aa1f95129e5e54670f1"},
        {"The quick brown fox jumps over the lazy dog", "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12"},
    }));

    CHECK(ToString(CalcSHA1(input.data(), input.size())) == expected);
}

TEST_CASE("SHA-1 of a million 'a's", "[core][hash]") {
    const std::string input(1'000'000, 'a');
    CHECK(ToString(CalcSHA1(input.data(), input.size())) == "34aa973cd4c4daa4f61eeb2bdbad27316534016f");
}

TEST_CASE("Incremental SHA-1 matches the one-shot digest", "[core][hash]") {
    std::vector<uint8> data(10'000);
    std::mt19937 rng{1234};
    for (auto &b : data) {
        b = static_cast<uint8>(rng());
    }
    const SHA1Hash expected = CalcSHA1(data.data(), data.size());

    // Chunk sizes that straddle the 64-byte block boundary in different ways
    const size_t chunkSize = GENERATE(1u, 3u, 63u, 64u, 65u, 1000u);

    SHA1 sha1{};
    for (size_t pos = 0; pos < data.size(); pos += chunkSize) {
        sha1.Update(std::span{data}.subspan(pos, std::min(chunkSize, data.size() - pos)));
    }
    CHECK(sha1.Final() == expected);

    SECTION("Final resets the hasher") {
        sha1.Update(AsBytes("abc"));
        CHECK(ToString(sha1.Final()) == "a9993e364706816aba3e25717850c26c9cd0d89d");
    }
}

TEST_CASE("CRC-32 matches the check value", "[core][hash]") {
    const std::string_view input = "123456789";
    CHECK(CalcCRC32(input.data(), input.size()) == 0xCBF43926);
    CHECK(CalcCRC32(nullptr, 0) == 0);

    CRC32 crc{};
    crc.Update(AsBytes("1234"));
    crc.Update(AsBytes("56789"));
    CHECK(crc.Value() == 0xCBF43926);
}

TEST_CASE("Readers are hashed in full", "[core][hash]") {
    const std::string_view text = "The quick brown fox jumps over the lazy dog";
    const std::vector<uint8> data(text.begin(), text.end());
    const media::MemoryBinaryReader reader{data};

    const FileDigest digest = HashReader(reader);
    CHECK(digest.size == text.size());
    CHECK(digest.sha1 == "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
    CHECK(digest.crc32 == 0x414FA339);
}

TEST_CASE("Files are hashed from disk", "[core][hash]") {
    const auto path =
        std::filesystem::temp_directory_path() / ("cuedat-hash-" + std::to_string(std::random_device{}()) + ".bin");

    SECTION("Existing file") {
        {
            std::ofstream out{path, std::ios::binary};
            out << "abc";
        }

        FileDigest digest{};
        std::error_code error{};
        REQUIRE(HashFile(path, digest, error));
        CHECK_FALSE(error);
        CHECK(digest.size == 3);
        CHECK(digest.sha1 == "a9993e364706816aba3e25717850c26c9cd0d89d");
        CHECK(digest.crc32 == 0x352441C2);
    }

    SECTION("Empty file") {
        {
            std::ofstream out{path, std::ios::binary};
        }

        FileDigest digest{};
        std::error_code error{};
        REQUIRE(HashFile(path, digest, error));
        CHECK(digest.size == 0);
        CHECK(digest.sha1 == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
        CHECK(digest.crc32 == 0);
    }

    SECTION("Missing file") {
        FileDigest digest{};
        std::error_code error{};
        CHECK_FALSE(HashFile(path, digest, error));
        CHECK(error);
    }

    std::error_code ec{};
    std::filesystem::remove(path, ec);
}

} // namespace hash_tests
