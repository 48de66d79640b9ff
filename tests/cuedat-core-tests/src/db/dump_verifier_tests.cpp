#include <catch2/catch_test_macros.hpp>

#include <cuedat/core/hash.hpp>
#include <cuedat/db/dump_verifier.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace cuedat;
using namespace cuedat::db;

namespace dump_verifier {

static constexpr const char *kCueText = "FILE \"Game (Track 1).bin\" BINARY\r\n"
                                        "  TRACK 01 MODE2/2352\r\n"
                                        "    INDEX 01 00:00:00\r\n"
                                        "FILE \"Game (Track 2).bin\" BINARY\r\n"
                                        "  TRACK 02 AUDIO\r\n"
                                        "    INDEX 00 00:00:00\r\n"
                                        "    INDEX 01 00:02:00\r\n";

static std::string Sha1Of(std::string_view text) {
    return cuedat::ToString(CalcSHA1(text.data(), text.size()));
}

static Catalogue MakeCatalogue() {
    Catalogue catalogue{};
    catalogue.AddGame(Game{.name = "Game",
                           .roms = {
                               Rom{.name = "Game.cue", .size = 0, .sha1 = Sha1Of(kCueText)},
                               Rom{.name = "Game (Track 1).bin", .size = 4'704'000, .sha1 = "11"},
                               Rom{.name = "Game (Track 2).bin", .size = 352'800, .sha1 = "12"},
                           }});
    catalogue.AddGame(Game{.name = "Other",
                           .roms = {
                               Rom{.name = "Other.bin", .size = 1000, .sha1 = "21"},
                           }});
    return catalogue;
}

static const std::vector<CandidateFile> kGoodDump{
    {"/dumps/Game/Game (Track 1).bin", 4'704'000, "11"},
    {"/dumps/Game/Game (Track 2).bin", 352'800, "12"},
    {"/dumps/Game/Game.cue", 200, "ffff"},
};

static bool HasProblem(const DumpVerification &result, std::string_view text) {
    return std::any_of(result.problems.begin(), result.problems.end(),
                       [&](const std::string &problem) { return problem.find(text) != std::string::npos; });
}

TEST_CASE("Complete dumps verify", "[db][dump_verifier]") {
    const Catalogue catalogue = MakeCatalogue();

    SECTION("Without a cue sheet") {
        auto result = VerifyDump(kGoodDump, std::nullopt, catalogue);
        CHECK(result.verified);
        CHECK(result.problems.empty());
        REQUIRE(result.game != nullptr);
        CHECK(result.game->name == "Game");
        CHECK(result.cue == CueVerification::NoCueNeeded);
    }

    SECTION("With the exact cue sheet") {
        auto result = VerifyDump(kGoodDump, DumpCueSheet{"Game.cue", kCueText}, catalogue);
        CHECK(result.verified);
        CHECK(result.cue == CueVerification::VerifiedExactly);
    }

    SECTION("With a cue sheet the game does not list") {
        auto result = VerifyDump(kGoodDump, DumpCueSheet{"Renamed.cue", "anything"}, catalogue);
        CHECK(result.verified);
        CHECK(result.cue == CueVerification::NoCueNeeded);
    }
}

TEST_CASE("Cue sheets that differ from the catalogue", "[db][dump_verifier]") {
    const Catalogue catalogue = MakeCatalogue();

    // Same geometry with LF line endings and an extra comment
    const std::string reformatted = "REM Ripped again\n"
                                    "FILE \"Game (Track 1).bin\" BINARY\n"
                                    "TRACK 01 MODE2/2352\n"
                                    "INDEX 01 00:00:00\n"
                                    "FILE \"Game (Track 2).bin\" BINARY\n"
                                    "TRACK 02 AUDIO\n"
                                    "INDEX 00 00:00:00\n"
                                    "INDEX 01 00:02:00\n";
    const DumpCueSheet dumpCue{"Game.cue", reformatted};

    SECTION("Without a reference") {
        auto result = VerifyDump(kGoodDump, dumpCue, catalogue);
        CHECK_FALSE(result.verified);
        CHECK(result.problems.empty());
        CHECK(result.cue == CueVerification::MismatchWithoutReference);
    }

    SECTION("Without a reference, when mismatches are allowed") {
        auto result = VerifyDump(kGoodDump, dumpCue, catalogue, {.allowCueMismatch = true});
        CHECK(result.verified);
        CHECK(result.cue == CueVerification::MismatchWithoutReference);
    }

    SECTION("Matching the reference geometry") {
        auto result = VerifyDump(kGoodDump, dumpCue, catalogue, {.referenceCue = kCueText});
        CHECK(result.verified);
        CHECK(result.cue == CueVerification::MatchesEssentials);
    }

    SECTION("Differing from the reference geometry") {
        std::string shifted = reformatted;
        shifted.replace(shifted.find("00:02:00"), 8, "00:03:00");
        auto result = VerifyDump(kGoodDump, DumpCueSheet{"Game.cue", shifted}, catalogue, {.referenceCue = kCueText});
        CHECK_FALSE(result.verified);
        CHECK(result.cue == CueVerification::DoesNotMatchEssentials);
    }
}

TEST_CASE("Track files must match the catalogue exactly", "[db][dump_verifier]") {
    const Catalogue catalogue = MakeCatalogue();

    SECTION("Unknown hash") {
        auto dump = kGoodDump;
        dump[1].sha1 = "99";
        auto result = VerifyDump(dump, std::nullopt, catalogue);
        CHECK_FALSE(result.verified);
        CHECK(HasProblem(result, "No matching ROM found for Game (Track 2).bin"));
    }

    SECTION("Renamed file") {
        auto dump = kGoodDump;
        dump[0].path = "/dumps/Game/track01.bin";
        auto result = VerifyDump(dump, std::nullopt, catalogue);
        CHECK_FALSE(result.verified);
        CHECK(HasProblem(result, "No matching ROM found for track01.bin"));
        CHECK(HasProblem(result, "Missing track file Game (Track 1).bin"));
    }

    SECTION("Wrong size") {
        auto dump = kGoodDump;
        dump[0].size = 4'704'001;
        auto result = VerifyDump(dump, std::nullopt, catalogue);
        CHECK_FALSE(result.verified);
        CHECK(HasProblem(result, "No matching ROM found for Game (Track 1).bin"));
    }

    SECTION("Missing track") {
        const std::vector<CandidateFile> dump{kGoodDump[0]};
        auto result = VerifyDump(dump, std::nullopt, catalogue);
        CHECK_FALSE(result.verified);
        REQUIRE(result.problems.size() == 1);
        CHECK(result.problems[0] == "Missing track file Game (Track 2).bin");
        REQUIRE(result.game != nullptr);
        CHECK(result.game->name == "Game");
    }

    SECTION("Tracks from different games") {
        auto dump = kGoodDump;
        dump.push_back({"Other.bin", 1000, "21"});
        auto result = VerifyDump(dump, std::nullopt, catalogue);
        CHECK_FALSE(result.verified);
        CHECK(HasProblem(result, "Track files belong to different games"));
        CHECK(result.game == nullptr);
    }

    SECTION("No track files") {
        const std::vector<CandidateFile> dump{kGoodDump[2]};
        auto result = VerifyDump(dump, std::nullopt, catalogue);
        CHECK_FALSE(result.verified);
        REQUIRE(result.problems.size() == 1);
        CHECK(result.problems[0] == "No .bin files found");
    }
}

TEST_CASE("Reference cue sheets can be looked up once the game is known", "[db][dump_verifier]") {
    const Catalogue catalogue = MakeCatalogue();
    const std::string reformatted = std::string{kCueText} + "REM extra\r\n";
    const DumpCueSheet dumpCue{"Game.cue", reformatted};

    std::vector<std::string> requested{};
    VerifyOptions options{};
    options.referenceCue = "FILE \"Unrelated.bin\" BINARY\n  TRACK 01 AUDIO\n    INDEX 01 00:00:00\n";

    SECTION("The provider is asked for the verified game and overrides the fixed reference") {
        options.referenceCueProvider = [&](const Game &game) -> std::optional<std::string> {
            requested.push_back(game.name);
            return std::string{kCueText};
        };
        auto result = VerifyDump(kGoodDump, dumpCue, catalogue, options);
        CHECK(result.verified);
        CHECK(result.cue == CueVerification::MatchesEssentials);
        CHECK(requested == std::vector<std::string>{"Game"});
    }

    SECTION("A game without a reference cue sheet") {
        options.referenceCueProvider = [&](const Game &game) -> std::optional<std::string> {
            requested.push_back(game.name);
            return std::nullopt;
        };
        auto result = VerifyDump(kGoodDump, dumpCue, catalogue, options);
        CHECK_FALSE(result.verified);
        CHECK(result.cue == CueVerification::MismatchWithoutReference);
        CHECK(requested.size() == 1);
    }

    SECTION("The provider is not consulted when the cue sheet verifies exactly") {
        options.referenceCueProvider = [&](const Game &game) -> std::optional<std::string> {
            requested.push_back(game.name);
            return std::nullopt;
        };
        auto result = VerifyDump(kGoodDump, DumpCueSheet{"Game.cue", kCueText}, catalogue, options);
        CHECK(result.cue == CueVerification::VerifiedExactly);
        CHECK(requested.empty());
    }
}

TEST_CASE("Track file CRC-32s are checked when the catalogue lists them", "[db][dump_verifier]") {
    Catalogue catalogue{};
    catalogue.AddGame(Game{.name = "Game",
                           .roms = {
                               Rom{.name = "Game (Track 1).bin", .size = 4'704'000, .sha1 = "11", .crc32 = "1A2B3C4D"},
                               Rom{.name = "Game (Track 2).bin", .size = 352'800, .sha1 = "12"},
                           }});

    auto dump = kGoodDump;
    dump.pop_back();

    SECTION("Matching CRC-32") {
        dump[0].crc32 = 0x1A2B3C4Du;
        dump[1].crc32 = 0x12345678u;
        auto result = VerifyDump(dump, std::nullopt, catalogue);
        CHECK(result.verified);
        CHECK(result.problems.empty());
    }

    SECTION("Differing CRC-32") {
        dump[0].crc32 = 0xDEADBEEFu;
        auto result = VerifyDump(dump, std::nullopt, catalogue);
        CHECK_FALSE(result.verified);
        CHECK(HasProblem(result, "CRC-32 mismatch for Game (Track 1).bin: expected 1A2B3C4D, got deadbeef"));
        CHECK(HasProblem(result, "Missing track file Game (Track 1).bin"));
    }

    SECTION("Files without a computed CRC-32") {
        auto result = VerifyDump(dump, std::nullopt, catalogue);
        CHECK(result.verified);
    }
}

TEST_CASE("Cue verification results have descriptions", "[db][dump_verifier]") {
    CHECK(ToString(CueVerification::NoCueNeeded) == "no cue sheet needed");
    CHECK(ToString(CueVerification::VerifiedExactly) == "cue sheet verified exactly");
    CHECK_FALSE(ToString(CueVerification::DoesNotMatchEssentials).empty());
}

} // namespace dump_verifier
