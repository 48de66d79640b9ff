#pragma once

/**
@file
@brief Materializes the output files described by a merge or split.
*/

#include <cuedat/media/cue/cue_defs.hpp>
#include <cuedat/media/cue/cue_result.hpp>

#include <filesystem>

namespace cuedat::media {

/// @brief Writes an output file by copying its byte ranges in order.
///
/// Range source paths are used as given (they already carry the cue sheet's base path). The output is written to
/// `outputDir / output.name`, replacing any existing file. An output that consists of a single source in full and
/// resolves to that same source is left untouched.
///
/// Possible failures:
/// - `InvalidOperation` if the output resolves to one of its sources in any other way
/// - `IOError` if a source cannot be opened or the output cannot be written
/// - `IntegrityError` if a source is shorter than the range that refers to it
///
/// The partially written file is removed on failure.
///
/// @param[in] output the output file description
/// @param[in] outputDir the directory to write to
/// @return the result of the operation
cue::CueResult WriteOutputFile(const cue::OutputFile &output, const std::filesystem::path &outputDir);

} // namespace cuedat::media
