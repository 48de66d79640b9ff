#include <catch2/catch_test_macros.hpp>

#include <cuedat/media/cue/track_merger.hpp>
#include <cuedat/media/cue/track_splitter.hpp>

#include <map>
#include <string>
#include <vector>

using namespace cuedat;
using namespace cuedat::media::cue;

namespace track_splitter {

static constexpr const char *kMergedSheet = R"(FILE "Game.bin" BINARY
  TRACK 01 MODE2/2352
    INDEX 01 00:00:00
  TRACK 02 AUDIO
    INDEX 00 01:00:00
    INDEX 01 01:02:00
  TRACK 03 AUDIO
    INDEX 00 01:16:00
    INDEX 01 01:18:00
)";

static ParseOptions MakeOptions(std::map<std::string, uintmax_t> sizes) {
    ParseOptions options{};
    options.sizeProvider = [sizes = std::move(sizes)](const std::string &path) -> uintmax_t {
        auto it = sizes.find(path);
        return it != sizes.end() ? it->second : 0;
    };
    return options;
}

TEST_CASE("Splitting cuts a single file at every track start", "[media][cue][track_splitter]") {
    const ParseOptions options = MakeOptions({{"Game.bin", 6600 * 2352}});

    SplitResult result{};
    REQUIRE(Split(kMergedSheet, "Game", options, result));

    CHECK(result.blocksize == 2352);
    CHECK(result.cueText == "FILE \"Game (Track 1).bin\" BINARY\n"
                            "  TRACK 01 MODE2/2352\n"
                            "    INDEX 01 00:00:00\n"
                            "FILE \"Game (Track 2).bin\" BINARY\n"
                            "  TRACK 02 AUDIO\n"
                            "    INDEX 00 00:00:00\n"
                            "    INDEX 01 00:02:00\n"
                            "FILE \"Game (Track 3).bin\" BINARY\n"
                            "  TRACK 03 AUDIO\n"
                            "    INDEX 00 00:00:00\n"
                            "    INDEX 01 00:02:00\n");

    SECTION("Sector counts are back-filled from the file size") {
        REQUIRE(result.file.tracks.size() == 3);
        CHECK(result.file.tracks[0].sectorCount == 4500u);
        CHECK(result.file.tracks[1].sectorCount == 1200u);
        CHECK(result.file.tracks[2].sectorCount == 900u);
    }

    SECTION("Every track gets its own byte range") {
        REQUIRE(result.outputs.size() == 3);
        CHECK(result.outputs[0].name == "Game (Track 1).bin");
        CHECK(result.outputs[1].name == "Game (Track 2).bin");
        CHECK(result.outputs[2].name == "Game (Track 3).bin");

        CHECK(result.outputs[0].ranges == std::vector<ByteRange>{{"Game.bin", 0, uintmax_t{4500} * 2352}});
        CHECK(result.outputs[1].ranges ==
              std::vector<ByteRange>{{"Game.bin", uintmax_t{4500} * 2352, uintmax_t{1200} * 2352}});
        CHECK(result.outputs[2].ranges ==
              std::vector<ByteRange>{{"Game.bin", uintmax_t{5700} * 2352, uintmax_t{900} * 2352}});
    }
}

TEST_CASE("The last track is open-ended when the file size is unknown", "[media][cue][track_splitter]") {
    SplitResult result{};
    REQUIRE(Split(kMergedSheet, "Game", {}, result));

    REQUIRE(result.outputs.size() == 3);
    CHECK(result.outputs[1].ranges[0].length == uintmax_t{1200} * 2352);
    CHECK(result.outputs[2].ranges[0].offset == uintmax_t{5700} * 2352);
    CHECK_FALSE(result.outputs[2].ranges[0].length.has_value());
    CHECK_FALSE(result.file.tracks[0].sectorCount.has_value());
}

TEST_CASE("Splitting undoes a merge", "[media][cue][track_splitter]") {
    static constexpr const char *kSplitSheet = R"(FILE "Game (Track 1).bin" BINARY
  TRACK 01 MODE2/2352
    INDEX 01 00:00:00
FILE "Game (Track 2).bin" BINARY
  TRACK 02 AUDIO
    INDEX 00 00:00:00
    INDEX 01 00:02:00
FILE "Game (Track 3).bin" BINARY
  TRACK 03 AUDIO
    INDEX 00 00:00:00
    INDEX 01 00:02:00
)";

    const ParseOptions mergeOptions = MakeOptions({
        {"Game (Track 1).bin", 4500 * 2352},
        {"Game (Track 2).bin", 1200 * 2352},
        {"Game (Track 3).bin", 900 * 2352},
    });

    MergeResult merged{};
    REQUIRE(Merge(kSplitSheet, "Game", mergeOptions, merged));

    const ParseOptions splitOptions = MakeOptions({{"Game.bin", uintmax_t{merged.layout.totalSectors} * 2352}});
    SplitResult split{};
    REQUIRE(Split(merged.cueText, "Game", splitOptions, split));

    CHECK(split.cueText == kSplitSheet);
    REQUIRE(split.outputs.size() == merged.files.size());
    for (size_t i = 0; i < split.outputs.size(); i++) {
        CHECK(split.outputs[i].name == merged.files[i].path);
        CHECK(split.outputs[i].ranges[0].length == merged.files[i].size);
    }
}

TEST_CASE("Gaps survive a split", "[media][cue][track_splitter]") {
    static constexpr const char *kSheet = R"(FILE "Game.bin" BINARY
  TRACK 01 MODE1/2352
    INDEX 01 00:00:00
  TRACK 02 AUDIO
    PREGAP 00:02:00
    INDEX 01 00:10:00
    POSTGAP 00:01:00
)";

    SplitResult result{};
    REQUIRE(Split(kSheet, "Game", {}, result));
    CHECK(result.cueText == "FILE \"Game (Track 1).bin\" BINARY\n"
                            "  TRACK 01 MODE1/2352\n"
                            "    INDEX 01 00:00:00\n"
                            "FILE \"Game (Track 2).bin\" BINARY\n"
                            "  TRACK 02 AUDIO\n"
                            "    PREGAP 00:02:00\n"
                            "    INDEX 01 00:00:00\n"
                            "    POSTGAP 00:01:00\n");
}

TEST_CASE("Single-track images keep the plain file name", "[media][cue][track_splitter]") {
    static constexpr const char *kSheet = "FILE \"Disc.bin\" BINARY\n  TRACK 01 MODE1/2048\n    INDEX 01 00:00:00\n";

    SplitResult result{};
    REQUIRE(Split(kSheet, "Game", MakeOptions({{"Disc.bin", 1000 * 2048}}), result));
    CHECK(result.blocksize == 2048);
    REQUIRE(result.outputs.size() == 1);
    CHECK(result.outputs[0].name == "Game.bin");
    CHECK(result.outputs[0].ranges == std::vector<ByteRange>{{"Disc.bin", 0, uintmax_t{1000} * 2048}});
}

TEST_CASE("Splitting rejects multi-file sheets", "[media][cue][track_splitter]") {
    static constexpr const char *kSheet = R"(FILE "a.bin" BINARY
  TRACK 01 MODE1/2352
    INDEX 01 00:00:00
FILE "b.bin" BINARY
  TRACK 02 AUDIO
    INDEX 01 00:00:00
)";

    SplitResult result{};
    auto splitResult = Split(kSheet, "Game", {}, result);
    CHECK(splitResult.type == CueResult::Type::InvalidOperation);
    CHECK(splitResult.message.find("references 2") != std::string::npos);
}

TEST_CASE("Splitting rejects files whose size is not a multiple of the blocksize", "[media][cue][track_splitter]") {
    SplitResult result{};
    auto splitResult = Split(kMergedSheet, "Game", MakeOptions({{"Game.bin", 6600 * 2352 + 1}}), result);
    CHECK(splitResult.type == CueResult::Type::IntegrityError);
}

} // namespace track_splitter
