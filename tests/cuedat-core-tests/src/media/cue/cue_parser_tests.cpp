#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <cuedat/media/cue/cue_parser.hpp>

#include <map>
#include <string>

using namespace cuedat;
using namespace cuedat::media::cue;

namespace cue_parser {

static constexpr const char *kMultiFileCue = R"(REM GENRE Game
FILE "Game (USA) (Track 1).bin" BINARY
  TRACK 01 MODE2/2352
    INDEX 01 00:00:00
FILE "Game (USA) (Track 2).bin" BINARY
  TRACK 02 AUDIO
    INDEX 00 00:00:00
    INDEX 01 00:02:00
FILE "Game (USA) (Track 3).bin" BINARY
  TRACK 03 AUDIO
    INDEX 00 00:00:00
    INDEX 01 00:02:00
)";

static constexpr const char *kSingleFileCue = R"(FILE "Game (USA).bin" BINARY
  TRACK 01 MODE2/2352
    INDEX 01 00:00:00
  TRACK 02 AUDIO
    INDEX 00 00:10:00
    INDEX 01 00:12:00
  TRACK 03 AUDIO
    INDEX 00 01:00:00
    INDEX 01 01:02:00
)";

static FileSizeProvider SizesFrom(std::map<std::string, uintmax_t> sizes) {
    return [sizes = std::move(sizes)](const std::string &path) -> uintmax_t {
        auto it = sizes.find(path);
        return it != sizes.end() ? it->second : 0;
    };
}

TEST_CASE("Multi-file cue sheets are parsed", "[media][cue][cue_parser]") {
    ParseOptions options{};
    options.basePath = "dumps";
    options.sizeProvider = SizesFrom({
        {"dumps/Game (USA) (Track 1).bin", 1000 * 2352},
        {"dumps/Game (USA) (Track 2).bin", 500 * 2352},
        {"dumps/Game (USA) (Track 3).bin", 250 * 2352},
    });

    CueSheet sheet{};
    REQUIRE(ParseCueSheet(kMultiFileCue, options, sheet));

    CHECK(sheet.blocksize == 2352);
    REQUIRE(sheet.files.size() == 3);

    CHECK(sheet.files[0].path == "dumps/Game (USA) (Track 1).bin");
    CHECK(sheet.files[0].format == "BINARY");
    CHECK(sheet.files[0].size == 1000 * 2352);
    REQUIRE(sheet.files[0].tracks.size() == 1);
    CHECK(sheet.files[0].tracks[0].number == 1);
    CHECK(sheet.files[0].tracks[0].trackType == "MODE2/2352");

    const Track &track2 = sheet.files[1].tracks.at(0);
    CHECK(track2.number == 2);
    CHECK(track2.trackType == "AUDIO");
    REQUIRE(track2.indexes.size() == 2);
    CHECK(track2.indexes[0] == TrackIndex{.id = 0, .stamp = "00:00:00", .fileOffset = 0});
    CHECK(track2.indexes[1] == TrackIndex{.id = 1, .stamp = "00:02:00", .fileOffset = 150});

    // Sector counts are only derived for single-file sheets
    CHECK_FALSE(track2.sectorCount.has_value());
}

TEST_CASE("Single-file cue sheets get per-track sector counts", "[media][cue][cue_parser]") {
    ParseOptions options{};
    options.sizeProvider = SizesFrom({{"Game (USA).bin", 6000 * 2352}});

    CueSheet sheet{};
    REQUIRE(ParseCueSheet(kSingleFileCue, options, sheet));
    REQUIRE(sheet.files.size() == 1);

    const auto &tracks = sheet.files[0].tracks;
    REQUIRE(tracks.size() == 3);
    CHECK(tracks[0].sectorCount == 750u);
    CHECK(tracks[1].sectorCount == 4500u - 750u);
    CHECK(tracks[2].sectorCount == 6000u - 4500u);

    SECTION("unknown file sizes skip the back-fill") {
        CueSheet unsized{};
        REQUIRE(ParseCueSheet(kSingleFileCue, {}, unsized));
        CHECK(unsized.files[0].size == 0);
        CHECK_FALSE(unsized.files[0].tracks[0].sectorCount.has_value());
    }
}

TEST_CASE("The first non-default track type locks the blocksize", "[media][cue][cue_parser]") {
    CueSheet sheet{};

    SECTION("data track first") {
        REQUIRE(ParseCueSheet("FILE \"a.bin\" BINARY\nTRACK 01 MODE1/2048\nINDEX 01 00:00:00\n"
                              "FILE \"b.bin\" BINARY\nTRACK 02 MODE2/2336\nINDEX 01 00:00:00\n",
                              {}, sheet));
        CHECK(sheet.blocksize == 2048);
    }

    SECTION("default-sized tracks before it do not lock") {
        REQUIRE(ParseCueSheet("FILE \"a.bin\" BINARY\nTRACK 01 AUDIO\nINDEX 01 00:00:00\n"
                              "FILE \"b.bin\" BINARY\nTRACK 02 CDG\nINDEX 01 00:00:00\n",
                              {}, sheet));
        CHECK(sheet.blocksize == 2448);
    }

    SECTION("a non-default starting blocksize is kept") {
        ParseOptions options{};
        options.blocksize = 2048;
        REQUIRE(ParseCueSheet("FILE \"a.bin\" BINARY\nTRACK 01 MODE2/2336\nINDEX 01 00:00:00\n", options, sheet));
        CHECK(sheet.blocksize == 2048);
    }
}

TEST_CASE("Empty cue sheets are rejected", "[media][cue][cue_parser]") {
    const std::string text = GENERATE(as<std::string>{}, "", "NOT A CUE SHEET", "REM only\nREM comments\n");

    CueSheet sheet{};
    const CueResult result = ParseCueSheet(text, {}, sheet);
    CHECK(result.type == CueResult::Type::StructuralError);
    CHECK(result.message.find("empty") != std::string::npos);
}

TEST_CASE("Lowercase cue sheets are parsed", "[media][cue][cue_parser]") {
    CueSheet sheet{};
    REQUIRE(ParseCueSheet("file \"game.bin\" binary\n  track 01 mode1/2048\n    index 01 00:00:00\n", {}, sheet));
    REQUIRE(sheet.files.size() == 1);
    REQUIRE(sheet.files[0].tracks.size() == 1);
    CHECK(sheet.files[0].tracks[0].trackType == "mode1/2048");

    // Track type tokens are not normalized, so the lowercase token resolves to the default size
    CHECK(sheet.blocksize == 2352);
}

TEST_CASE("CRLF line endings are accepted", "[media][cue][cue_parser]") {
    CueSheet sheet{};
    REQUIRE(
        ParseCueSheet("FILE \"game.bin\" BINARY\r\n  TRACK 01 MODE1/2352\r\n    INDEX 01 00:00:00\r\n", {}, sheet));
    REQUIRE(sheet.files.size() == 1);
    CHECK(sheet.files[0].path == "game.bin");
    CHECK(sheet.files[0].tracks[0].indexes[0].fileOffset == 0);
}

TEST_CASE("Orphan statements are dropped", "[media][cue][cue_parser]") {
    CueSheet sheet{};
    REQUIRE(ParseCueSheet("TRACK 01 MODE1/2048\n"
                          "INDEX 01 00:00:00\n"
                          "FILE \"game.bin\" BINARY\n"
                          "INDEX 01 00:00:00\n"
                          "PREGAP 00:02:00\n"
                          "TRACK 01 AUDIO\n"
                          "INDEX 01 00:00:00\n",
                          {}, sheet));

    REQUIRE(sheet.files.size() == 1);
    REQUIRE(sheet.files[0].tracks.size() == 1);
    CHECK(sheet.files[0].tracks[0].indexes.size() == 1);
    CHECK_FALSE(sheet.files[0].tracks[0].pregap.has_value());

    // The dropped TRACK never locked the blocksize
    CHECK(sheet.blocksize == 2352);
}

TEST_CASE("Gaps are recorded on their track", "[media][cue][cue_parser]") {
    CueSheet sheet{};
    REQUIRE(ParseCueSheet("FILE \"game.bin\" BINARY\n"
                          "  TRACK 01 AUDIO\n"
                          "    PREGAP 00:02:00\n"
                          "    INDEX 01 00:00:00\n"
                          "    POSTGAP 00:00:30\n",
                          {}, sheet));

    const Track &track = sheet.files[0].tracks[0];
    CHECK(track.pregap == 150u);
    CHECK(track.postgap == 30u);
}

TEST_CASE("Malformed and inconsistent sheets are rejected", "[media][cue][cue_parser]") {
    CueSheet sheet{};

    SECTION("bad index timestamp") {
        const CueResult result =
            ParseCueSheet("FILE \"game.bin\" BINARY\nTRACK 01 AUDIO\nINDEX 01 00:0x:00\n", {}, sheet);
        CHECK(result.type == CueResult::Type::FormatError);
        CHECK(result.message.find("00:0x:00") != std::string::npos);
    }

    SECTION("bad gap timestamp") {
        const CueResult result =
            ParseCueSheet("FILE \"game.bin\" BINARY\nTRACK 01 AUDIO\nPREGAP 2 seconds\n", {}, sheet);
        CHECK(result.type == CueResult::Type::FormatError);
    }

    SECTION("index points going backwards") {
        const CueResult result = ParseCueSheet("FILE \"game.bin\" BINARY\n"
                                               "TRACK 01 AUDIO\nINDEX 01 00:10:00\n"
                                               "TRACK 02 AUDIO\nINDEX 01 00:05:00\n",
                                               {}, sheet);
        CHECK(result.type == CueResult::Type::IntegrityError);
    }

    SECTION("track without an index") {
        const CueResult result = ParseCueSheet("FILE \"game.bin\" BINARY\nTRACK 01 AUDIO\n", {}, sheet);
        CHECK(result.type == CueResult::Type::StructuralError);
    }

    SECTION("size not a multiple of the blocksize") {
        ParseOptions options{};
        options.sizeProvider = SizesFrom({{"game.bin", 2352 * 10 + 1}});
        const CueResult result =
            ParseCueSheet("FILE \"game.bin\" BINARY\nTRACK 01 AUDIO\nINDEX 01 00:00:00\n", options, sheet);
        CHECK(result.type == CueResult::Type::IntegrityError);
    }

    SECTION("track starting past the end of the file") {
        ParseOptions options{};
        options.sizeProvider = SizesFrom({{"game.bin", 2352 * 10}});
        const CueResult result = ParseCueSheet("FILE \"game.bin\" BINARY\n"
                                               "TRACK 01 AUDIO\nINDEX 01 00:00:00\n"
                                               "TRACK 02 AUDIO\nINDEX 01 00:01:00\n",
                                               options, sheet);
        CHECK(result.type == CueResult::Type::IntegrityError);
    }

    CHECK(sheet.files.empty());
}

} // namespace cue_parser
