#pragma once

/**
@file
@brief Cue sheet parser.
*/

#include "cue_defs.hpp"
#include "cue_result.hpp"

#include <cuedat/media/track_type.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cuedat::media::cue {

/// @brief Retrieves the size of a file referenced by a cue sheet.
///
/// Receives the path as it will be stored in `BinFile::path` and returns the size in bytes, or 0 if unknown.
using FileSizeProvider = std::function<uintmax_t(const std::string &path)>;

/// @brief Parameters for `ParseCueSheet` and the operations built on it.
struct ParseOptions {
    /// Directory prepended to every FILE name. Left empty to keep names verbatim.
    std::string basePath;

    /// Starting blocksize. While it is the 2352 default, the first track type with a different sector size replaces
    /// it for the rest of the parse.
    uint32 blocksize = kDefaultBlocksize;

    /// Fills in `BinFile::size`. When not set, every size is 0 (unknown).
    FileSizeProvider sizeProvider;
};

/// @brief Parses cue sheet text into its FILE/TRACK/INDEX structure.
///
/// Lines other than FILE, TRACK, INDEX, PREGAP and POSTGAP are ignored. A TRACK before any FILE and an INDEX before any
/// TRACK are dropped rather than rejected.
///
/// When the sheet references exactly one file and its size is known, per-track sector counts are filled in with
/// `BackfillSectorCounts`.
///
/// Possible failures:
/// - `StructuralError` if no FILE statement was found or a track has no INDEX statement
/// - `FormatError` if an INDEX, PREGAP or POSTGAP timestamp is malformed
/// - `IntegrityError` if index offsets decrease within a file, or the back-fill fails
///
/// @param[in] text the cue sheet text
/// @param[in] options parsing options
/// @param[out] sheet receives the parsed sheet on success
/// @return the result of the operation
CueResult ParseCueSheet(std::string_view text, const ParseOptions &options, CueSheet &sheet);

/// @brief Derives `Track::sectorCount` for every track of a file holding several tracks back-to-back.
///
/// Walks the tracks in reverse: the last track extends to the end of the file and every other track extends up to
/// the first index of the next track. Does nothing when `file.size` is 0.
///
/// Fails with `IntegrityError` if `file.size` is not a multiple of `blocksize` or a track would end up with a negative
/// length.
///
/// @param[in,out] file the file whose tracks will be updated
/// @param[in] blocksize the sector size
/// @return the result of the operation
CueResult BackfillSectorCounts(BinFile &file, uint32 blocksize);

} // namespace cuedat::media::cue
