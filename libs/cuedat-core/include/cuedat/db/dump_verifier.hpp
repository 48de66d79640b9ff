#pragma once

/**
@file
@brief Strict verification of a complete dump against a `Catalogue`.

Unlike `Identify`, which tolerates re-ripped or renamed dumps, verification requires every track file to be exactly
what the catalogue lists: same name, same size, same SHA-1, all belonging to one game, with no track missing.
*/

#include "catalogue.hpp"
#include "catalogue_matcher.hpp"

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cuedat::db {

/// @brief How the cue sheet of a dump compares to the catalogue.
enum class CueVerification {
    NoCueNeeded,              ///< The dump has no cue sheet, or the game lists none
    VerifiedExactly,          ///< The cue sheet has the SHA-1 listed in the catalogue
    MatchesEssentials,        ///< Hashes differ, but the geometry matches the reference cue sheet
    MismatchWithoutReference, ///< Hashes differ and no reference cue sheet was provided to compare geometry
    DoesNotMatchEssentials,   ///< The geometry differs from the reference cue sheet
};

/// @brief The cue sheet found in a dump.
struct DumpCueSheet {
    std::string name; ///< File name, compared with the catalogue ROM names
    std::string text; ///< Contents of the file
};

/// @brief Retrieves the original cue sheet of a game, or `std::nullopt` if there is none.
using ReferenceCueProvider = std::function<std::optional<std::string>(const Game &game)>;

/// @brief Verification parameters.
struct VerifyOptions {
    /// The original cue sheet of the game, used to compare geometry when hashes differ.
    std::optional<std::string> referenceCue;

    /// Looks up the original cue sheet once the game is known. Takes precedence over `referenceCue` when set.
    ReferenceCueProvider referenceCueProvider;

    /// Accept `CueVerification::MismatchWithoutReference` as verified.
    bool allowCueMismatch = false;

    /// Extension of the files holding track data.
    std::string trackExtension = ".bin";
};

/// @brief The outcome of a verification.
struct DumpVerification {
    bool verified = false;
    const Game *game = nullptr;        ///< The game the track files belong to, if they could be attributed to one
    std::vector<std::string> problems; ///< Every discrepancy found; empty when the track files verify
    CueVerification cue = CueVerification::NoCueNeeded;
};

/// @brief Verifies a dump.
/// @param[in] files the files of the dump with their hashes; only those with the track extension are checked
/// @param[in] cueSheet the cue sheet of the dump, if any
/// @param[in] catalogue the reference catalogue
/// @param[in] options verification parameters
/// @return the verification outcome
DumpVerification VerifyDump(std::span<const CandidateFile> files, const std::optional<DumpCueSheet> &cueSheet,
                            const Catalogue &catalogue, const VerifyOptions &options = {});

/// @brief Retrieves a human-readable description of the cue verification result.
std::string_view ToString(CueVerification result);

} // namespace cuedat::db
