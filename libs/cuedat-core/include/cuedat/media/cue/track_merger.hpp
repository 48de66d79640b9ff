#pragma once

/**
@file
@brief Merges the tracks of a multi-file cue sheet into a single image.
*/

#include "cue_defs.hpp"
#include "cue_parser.hpp"
#include "cue_result.hpp"

#include <cuedat/core/types.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cuedat::media::cue {

/// @brief Where each source file lands in a merged image.
struct MergeLayout {
    /// Sector at which each file starts in the merged image, in sheet order. The first entry is always 0.
    std::vector<uint32> fileSectorOffsets;

    /// Total number of sectors in the merged image.
    uint32 totalSectors = 0;
};

/// @brief The outcome of a successful merge.
struct MergeResult {
    std::string cueText;        ///< The merged cue sheet
    std::vector<BinFile> files; ///< The source files as parsed, with sizes filled in
    MergeLayout layout;         ///< Sector offsets of each source file in the merged image
    OutputFile output;          ///< The bytes of the merged image: every source file in full, in order
    uint32 blocksize = 2352;    ///< The blocksize locked in by the parser
};

/// @brief Computes the sector offset of every file in a merged image.
///
/// Each file contributes `size / blocksize` sectors, so the merged image is the plain concatenation of the files.
///
/// Fails with `IntegrityError` if any size is not a multiple of the blocksize, or if there is more than one file and
/// the size of any of them is unknown (0), since the offsets of the files after it cannot be derived.
///
/// @param[in] files the source files in sheet order
/// @param[in] blocksize the sector size
/// @param[out] layout receives the layout on success
/// @return the result of the operation
CueResult ComputeMergeLayout(std::span<const BinFile> files, uint32 blocksize, MergeLayout &layout);

/// @brief Parses a cue sheet and produces the cue sheet and byte layout of the merged image `basename.bin`.
///
/// A sheet with a single file is a valid no-op merge: the geometry is re-emitted under the new name.
///
/// @param[in] cueText the source cue sheet
/// @param[in] basename name of the merged image without extension
/// @param[in] options parsing options; `sizeProvider` should be set for multi-file sheets
/// @param[out] result receives the merge result on success
/// @return the result of the operation
CueResult Merge(std::string_view cueText, std::string_view basename, const ParseOptions &options,
                MergeResult &result);

} // namespace cuedat::media::cue
