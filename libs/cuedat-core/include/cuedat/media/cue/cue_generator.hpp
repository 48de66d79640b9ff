#pragma once

/**
@file
@brief Renders cue sheet text from parsed geometry.

Only FILE, TRACK, PREGAP, INDEX and POSTGAP statements are emitted. Indentation follows the usual layout produced by
dumping tools: two spaces before TRACK and four before the statements that belong to a track.
*/

#include "cue_defs.hpp"

#include <cuedat/core/types.hpp>

#include <span>
#include <string>
#include <string_view>

namespace cuedat::media::cue {

/// @brief Renders the cue sheet of a merged image.
///
/// The sheet references a single `basename.bin` file. Every index of `files[i]` is rebased by adding
/// `fileSectorOffsets[i]`, which is the sector at which that file starts in the merged image (see
/// `ComputeMergeLayout`).
///
/// @param[in] basename name of the merged image without extension
/// @param[in] files the source files in sheet order
/// @param[in] fileSectorOffsets starting sector of each file; must have the same length as `files`
/// @return the cue sheet text
std::string GenerateMergedCueSheet(std::string_view basename, std::span<const BinFile> files,
                                   std::span<const uint32> fileSectorOffsets);

/// @brief Renders the cue sheet of a split image.
///
/// Every track gets its own FILE statement named with `SplitTrackFilename`. Index stamps are made relative to the
/// track's first index, so the first index always reads 00:00:00 and the spacing between indexes is preserved.
///
/// @param[in] basename name of the image without extension
/// @param[in] file the single file holding every track
/// @return the cue sheet text
std::string GenerateSplitCueSheet(std::string_view basename, const BinFile &file);

/// @brief Names the file holding a track of a split image, following Redump conventions.
///
/// - a single track: `basename.bin`
/// - up to 9 tracks: `basename (Track N).bin`
/// - 10 tracks or more: `basename (Track NN).bin`
///
/// @param[in] basename name of the image without extension
/// @param[in] trackNumber the track number
/// @param[in] trackCount the total number of tracks in the image
/// @return the file name
std::string SplitTrackFilename(std::string_view basename, uint32 trackNumber, size_t trackCount);

/// @brief Reduces a cue sheet to the statements that define its geometry.
///
/// Lines are trimmed; everything other than FILE, TRACK, PREGAP, INDEX and POSTGAP is removed (comments, CATALOG,
/// FLAGS, titles, ...) along with blank lines. Two sheets describing the same layout normalize to the same text even
/// when one of them carries extra metadata or CRLF line endings.
///
/// @param[in] text the cue sheet text
/// @return the normalized text, one statement per line, each terminated by `\n`
std::string NormalizeCueSheet(std::string_view text);

} // namespace cuedat::media::cue
