#include <cuedat/db/catalogue_matcher.hpp>

#include <cuedat/util/unreachable.hpp>

#include "db_devlog.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <map>

namespace cuedat::db {

bool HasExtension(std::string_view name, std::string_view extension) {
    if (name.size() < extension.size()) {
        return false;
    }
    const std::string_view suffix = name.substr(name.size() - extension.size());
    return std::equal(suffix.begin(), suffix.end(), extension.begin(), extension.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string_view ToString(MatchStatus status) {
    switch (status) {
    case MatchStatus::None: return "none";
    case MatchStatus::Partial: return "partial";
    case MatchStatus::Match: return "match";
    }
    util::unreachable();
}

static uint64 TrackDataSize(const Game &game, std::string_view extension) {
    uint64 total = 0;
    for (const Rom &rom : game.roms) {
        if (HasExtension(rom.name, extension)) {
            total += rom.size;
        }
    }
    return total;
}

static std::optional<MatchVerdict> MatchByContentHash(std::span<const CandidateFile> candidates,
                                                      const Catalogue &catalogue) {
    // game index -> number of candidate files found in that game
    std::map<size_t, size_t> hits{};
    for (const CandidateFile &file : candidates) {
        for (const RomLocation &location : catalogue.FindBySha1(file.sha1)) {
            hits[location.gameIndex]++;
        }
    }
    if (hits.empty()) {
        return std::nullopt;
    }

    MatchVerdict verdict{};
    verdict.method = MatchMethod::ContentHash;
    verdict.reason = "match via content hash";
    size_t bestHits = 0;
    for (const auto &[gameIndex, count] : hits) {
        const Game &game = catalogue.GetGame(gameIndex);
        verdict.candidates.push_back(&game);
        if (count > bestHits) {
            bestHits = count;
            verdict.game = &game;
        }
    }
    verdict.status = hits.size() == 1 ? MatchStatus::Match : MatchStatus::Partial;
    return verdict;
}

std::optional<MatchVerdict> Identify(std::span<const CandidateFile> candidates, const Catalogue &catalogue,
                                     const core::Configuration::Matcher &config) {
    if (candidates.empty()) {
        return std::nullopt;
    }

    if (auto verdict = MatchByContentHash(candidates, catalogue)) {
        devlog::debug<grp::matcher>("{} game(s) matched by content hash", verdict->candidates.size());
        return verdict;
    }

    uint64 candidateSize = 0;
    for (const CandidateFile &file : candidates) {
        if (HasExtension(file.path, config.trackExtension)) {
            candidateSize += file.size;
        }
    }
    if (candidateSize == 0) {
        return MatchVerdict{.reason = fmt::format("no hash match and no {} files to compare sizes with",
                                                  config.trackExtension)};
    }

    // Tier 2 and 3 share the per-game sums
    MatchVerdict verdict{};
    const Game *closest = nullptr;
    uint64 closestDelta = 0;
    for (const Game &game : catalogue.Games()) {
        const uint64 gameSize = TrackDataSize(game, config.trackExtension);
        if (gameSize == 0) {
            continue;
        }
        if (gameSize == candidateSize) {
            verdict.candidates.push_back(&game);
        }
        const uint64 delta = gameSize > candidateSize ? gameSize - candidateSize : candidateSize - gameSize;
        if (closest == nullptr || delta < closestDelta) {
            closest = &game;
            closestDelta = delta;
        }
    }

    if (!verdict.candidates.empty()) {
        verdict.status = verdict.candidates.size() == 1 ? MatchStatus::Match : MatchStatus::Partial;
        verdict.method = MatchMethod::CombinedTrackSize;
        verdict.game = verdict.candidates.front();
        verdict.reason = "match via combined track size";
        devlog::debug<grp::matcher>("{} game(s) matched by combined track size {}", verdict.candidates.size(),
                                    candidateSize);
        return verdict;
    }

    if (closest == nullptr) {
        verdict.reason = "catalogue has no games with track data";
        return verdict;
    }

    const double percent = static_cast<double>(closestDelta) * 100.0 / static_cast<double>(candidateSize);
    if (closestDelta < config.closestSizeThreshold) {
        verdict.status = MatchStatus::Partial;
        verdict.method = MatchMethod::ClosestTrackSize;
        verdict.game = closest;
        verdict.candidates.push_back(closest);
        verdict.reason = fmt::format("closest match via combined track size, off by {} bytes ({:.2f}%)", closestDelta,
                                     percent);
    } else {
        verdict.reason = fmt::format("closest game \"{}\" is off by {} bytes ({:.2f}%), over the {}-byte threshold",
                                     closest->name, closestDelta, percent, config.closestSizeThreshold);
    }
    devlog::debug<grp::matcher>("Closest game: {} ({} bytes off)", closest->name, closestDelta);
    return verdict;
}

} // namespace cuedat::db
