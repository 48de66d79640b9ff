#pragma once

/**
@file
@brief Identifies a set of dumped files against a `Catalogue`.
*/

#include "catalogue.hpp"

#include <cuedat/core/configuration.hpp>
#include <cuedat/core/types.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cuedat::db {

/// @brief A dumped file to be identified.
struct CandidateFile {
    std::string path;            ///< File path or name; only the extension matters to the matcher
    uint64 size = 0;             ///< Size in bytes
    std::string sha1;            ///< Hex SHA-1 of the contents
    std::optional<uint32> crc32; ///< CRC-32 of the contents, checked by `VerifyDump` when the catalogue lists one
};

/// @brief How confident an identification is.
enum class MatchStatus {
    None,    ///< No game could be associated with the files
    Partial, ///< A game was found by approximation, or the files are ambiguous
    Match,   ///< The files belong to exactly one game
};

/// @brief Which rule produced a verdict.
enum class MatchMethod {
    None,              ///< No rule matched
    ContentHash,       ///< File hashes found in the catalogue
    CombinedTrackSize, ///< Total track data size equals a game's
    ClosestTrackSize,  ///< Total track data size is close enough to a game's
};

/// @brief The outcome of an identification.
struct MatchVerdict {
    MatchStatus status = MatchStatus::None;
    MatchMethod method = MatchMethod::None;

    /// The identified game. Set whenever `status` is not `None`. For ambiguous results this is the most likely game:
    /// the one referenced by the most candidate files (content hash) or the first in catalogue order (sizes).
    const Game *game = nullptr;

    /// Every game the rule selected, in catalogue order. Holds more than one entry only for ambiguous results.
    std::vector<const Game *> candidates;

    /// Human-readable explanation of the verdict.
    std::string reason;
};

/// @brief Identifies which catalogue game a set of files belongs to.
///
/// Rules are tried in order and the first one that selects any game wins:
/// 1. Content hash: every file's SHA-1 is looked up. One distinct game is a `Match`, several are `Partial`.
/// 2. Combined track size: the sizes of the files with the track extension are summed and compared with the same sum
///    over each game's ROMs. One exact match is a `Match`, several are `Partial`.
/// 3. Closest track size: the game with the smallest size difference (first in catalogue order on ties) is a
///    `Partial` if the difference is below `config.closestSizeThreshold`; otherwise the verdict is `None`.
///
/// Games without track data and candidate sets without track data never take part in rules 2 and 3.
///
/// @param[in] candidates the files to identify; all hashes must be computed beforehand
/// @param[in] catalogue the reference catalogue
/// @param[in] config matcher tuning
/// @return the verdict, or `std::nullopt` if `candidates` is empty
std::optional<MatchVerdict> Identify(std::span<const CandidateFile> candidates, const Catalogue &catalogue,
                                     const core::Configuration::Matcher &config = {});

/// @brief Determines if a file name ends with the given extension, ignoring case.
bool HasExtension(std::string_view name, std::string_view extension);

/// @brief Retrieves a human-readable name for the match status: "match", "partial" or "none".
std::string_view ToString(MatchStatus status);

} // namespace cuedat::db
