#include <cuedat/media/cue/track_merger.hpp>

#include <cuedat/media/cue/cue_generator.hpp>

#include "cue_devlog.hpp"

#include <fmt/format.h>

namespace cuedat::media::cue {

CueResult ComputeMergeLayout(std::span<const BinFile> files, uint32 blocksize, MergeLayout &layout) {
    MergeLayout newLayout{};
    newLayout.fileSectorOffsets.reserve(files.size());

    uintmax_t sectorPosition = 0;
    for (const BinFile &file : files) {
        if (file.size == 0 && files.size() > 1) {
            return CueResult::IntegrityError(
                fmt::format("Size of \"{}\" is unknown; cannot place the files that follow it", file.path));
        }
        if (file.size % blocksize != 0) {
            return CueResult::IntegrityError(fmt::format("Size of \"{}\" ({} bytes) is not a multiple of {}",
                                                         file.path, file.size, blocksize));
        }
        newLayout.fileSectorOffsets.push_back(static_cast<uint32>(sectorPosition));
        sectorPosition += file.size / blocksize;
    }
    newLayout.totalSectors = static_cast<uint32>(sectorPosition);

    layout = std::move(newLayout);
    return CueResult::Success();
}

CueResult Merge(std::string_view cueText, std::string_view basename, const ParseOptions &options,
                MergeResult &result) {
    CueSheet sheet{};
    if (auto parseResult = ParseCueSheet(cueText, options, sheet); !parseResult) {
        return parseResult;
    }

    MergeLayout layout{};
    if (auto layoutResult = ComputeMergeLayout(sheet.files, sheet.blocksize, layout); !layoutResult) {
        return layoutResult;
    }

    // Tracks in multi-file sheets usually occupy one file each; size them from their own files
    if (sheet.files.size() > 1) {
        for (BinFile &file : sheet.files) {
            if (auto backfillResult = BackfillSectorCounts(file, sheet.blocksize); !backfillResult) {
                return backfillResult;
            }
        }
    }

    OutputFile output{.name = fmt::format("{}.bin", basename)};
    for (const BinFile &file : sheet.files) {
        output.ranges.push_back({.sourcePath = file.path, .offset = 0, .length = std::nullopt});
    }

    result.cueText = GenerateMergedCueSheet(basename, sheet.files, layout.fileSectorOffsets);
    result.files = std::move(sheet.files);
    result.layout = std::move(layout);
    result.output = std::move(output);
    result.blocksize = sheet.blocksize;

    devlog::info<grp::merger>("Merged {} file(s) into {} ({} sectors)", result.files.size(), result.output.name,
                              result.layout.totalSectors);
    return CueResult::Success();
}

} // namespace cuedat::media::cue
