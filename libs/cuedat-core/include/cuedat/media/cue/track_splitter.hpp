#pragma once

/**
@file
@brief Splits a single-file cue sheet into one file per track.
*/

#include "cue_defs.hpp"
#include "cue_parser.hpp"
#include "cue_result.hpp"

#include <cuedat/core/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cuedat::media::cue {

/// @brief The outcome of a successful split.
struct SplitResult {
    std::string cueText;             ///< The split cue sheet
    BinFile file;                    ///< The source file as parsed; sector counts are filled in if its size is known
    std::vector<OutputFile> outputs; ///< One output per track, in track order
    uint32 blocksize = 2352;         ///< The blocksize locked in by the parser
};

/// @brief Computes the byte range of every track of a single file.
///
/// Track N covers the bytes from its first index up to the first index of track N+1. The last track extends to the end
/// of the file; its length is explicit when `file.size` is known and open-ended otherwise.
///
/// @param[in] basename name of the image without extension, used to name the outputs
/// @param[in] file the file holding every track
/// @param[in] blocksize the sector size
/// @return one output per track
std::vector<OutputFile> ComputeSplitOutputs(std::string_view basename, const BinFile &file, uint32 blocksize);

/// @brief Parses a cue sheet and produces the cue sheet and byte layout of its split form.
///
/// Fails with `InvalidOperation` if the sheet references more than one file.
///
/// @param[in] cueText the source cue sheet
/// @param[in] basename name of the image without extension
/// @param[in] options parsing options; set `sizeProvider` to get explicit lengths for the last track
/// @param[out] result receives the split result on success
/// @return the result of the operation
CueResult Split(std::string_view cueText, std::string_view basename, const ParseOptions &options,
                SplitResult &result);

} // namespace cuedat::media::cue
