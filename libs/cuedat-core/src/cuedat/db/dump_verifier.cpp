#include <cuedat/db/dump_verifier.hpp>

#include <cuedat/core/hash.hpp>
#include <cuedat/media/cue/cue_generator.hpp>
#include <cuedat/util/unreachable.hpp>

#include "db_devlog.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <set>

namespace cuedat::db {

std::string_view ToString(CueVerification result) {
    switch (result) {
    case CueVerification::NoCueNeeded: return "no cue sheet needed";
    case CueVerification::VerifiedExactly: return "cue sheet verified exactly";
    case CueVerification::MatchesEssentials: return "cue sheet matches the essential structure of the reference";
    case CueVerification::MismatchWithoutReference: return "cue sheet does not match and no reference was provided";
    case CueVerification::DoesNotMatchEssentials:
        return "cue sheet does not match the essential structure of the reference";
    }
    util::unreachable();
}

static CueVerification VerifyCueSheet(const DumpCueSheet &cueSheet, const Game &game, const VerifyOptions &options) {
    auto it = std::find_if(game.roms.begin(), game.roms.end(),
                           [&](const Rom &rom) { return rom.name == cueSheet.name; });
    if (it == game.roms.end()) {
        return CueVerification::NoCueNeeded;
    }
    if (cuedat::ToString(CalcSHA1(cueSheet.text.data(), cueSheet.text.size())) == it->sha1) {
        return CueVerification::VerifiedExactly;
    }
    const std::optional<std::string> referenceCue =
        options.referenceCueProvider ? options.referenceCueProvider(game) : options.referenceCue;
    if (!referenceCue) {
        return CueVerification::MismatchWithoutReference;
    }
    if (media::cue::NormalizeCueSheet(cueSheet.text) == media::cue::NormalizeCueSheet(*referenceCue)) {
        return CueVerification::MatchesEssentials;
    }
    return CueVerification::DoesNotMatchEssentials;
}

DumpVerification VerifyDump(std::span<const CandidateFile> files, const std::optional<DumpCueSheet> &cueSheet,
                            const Catalogue &catalogue, const VerifyOptions &options) {
    DumpVerification result{};

    // Every track file must be an exact catalogue entry
    std::vector<RomLocation> verified{};
    for (const CandidateFile &file : files) {
        if (!HasExtension(file.path, options.trackExtension)) {
            continue;
        }
        const std::string fileName = std::filesystem::path{file.path}.filename().string();
        const auto locations = catalogue.FindBySha1(file.sha1);
        auto it = std::find_if(locations.begin(), locations.end(), [&](const RomLocation &location) {
            const Rom &rom = catalogue.GetRom(location);
            return rom.name == fileName && rom.size == file.size;
        });
        if (it == locations.end()) {
            result.problems.push_back(
                fmt::format("No matching ROM found for {} (SHA-1: {}, {} bytes)", fileName, file.sha1, file.size));
            continue;
        }
        const Rom &rom = catalogue.GetRom(*it);
        if (rom.crc32 && file.crc32 && ToLower(*rom.crc32) != fmt::format("{:08x}", *file.crc32)) {
            result.problems.push_back(
                fmt::format("CRC-32 mismatch for {}: expected {}, got {:08x}", fileName, *rom.crc32, *file.crc32));
            continue;
        }
        verified.push_back(*it);
    }

    if (verified.empty()) {
        if (result.problems.empty()) {
            result.problems.push_back(fmt::format("No {} files found", options.trackExtension));
        }
        return result;
    }

    const size_t gameIndex = verified.front().gameIndex;
    if (std::any_of(verified.begin(), verified.end(),
                    [&](const RomLocation &location) { return location.gameIndex != gameIndex; })) {
        result.problems.push_back("Track files belong to different games");
        return result;
    }
    result.game = &catalogue.GetGame(gameIndex);

    // ... and no track of the game may be missing
    std::set<size_t> found{};
    for (const RomLocation &location : verified) {
        found.insert(location.romIndex);
    }
    for (size_t romIndex = 0; romIndex < result.game->roms.size(); romIndex++) {
        const Rom &rom = result.game->roms[romIndex];
        if (HasExtension(rom.name, options.trackExtension) && !found.contains(romIndex)) {
            result.problems.push_back(fmt::format("Missing track file {}", rom.name));
        }
    }

    if (cueSheet) {
        result.cue = VerifyCueSheet(*cueSheet, *result.game, options);
    }

    const bool cueAccepted = result.cue == CueVerification::NoCueNeeded ||
                             result.cue == CueVerification::VerifiedExactly ||
                             result.cue == CueVerification::MatchesEssentials ||
                             (result.cue == CueVerification::MismatchWithoutReference && options.allowCueMismatch);
    result.verified = result.problems.empty() && cueAccepted;

    devlog::debug<grp::verifier>("{}: {} track file(s) verified, {} problem(s), {}", result.game->name,
                                 verified.size(), result.problems.size(), ToString(result.cue));
    return result;
}

} // namespace cuedat::db
