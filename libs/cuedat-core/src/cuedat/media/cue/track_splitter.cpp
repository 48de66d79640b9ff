#include <cuedat/media/cue/track_splitter.hpp>

#include <cuedat/media/cue/cue_generator.hpp>

#include "cue_devlog.hpp"

#include <fmt/format.h>

namespace cuedat::media::cue {

std::vector<OutputFile> ComputeSplitOutputs(std::string_view basename, const BinFile &file, uint32 blocksize) {
    std::vector<OutputFile> outputs{};
    outputs.reserve(file.tracks.size());

    for (size_t i = 0; i < file.tracks.size(); i++) {
        const Track &track = file.tracks[i];
        const uintmax_t start = uintmax_t{track.StartOffset()} * blocksize;

        ByteRange range{.sourcePath = file.path, .offset = start};
        if (i + 1 < file.tracks.size()) {
            range.length = uintmax_t{file.tracks[i + 1].StartOffset()} * blocksize - start;
        } else if (file.size != 0) {
            range.length = file.size - start;
        }

        if constexpr (devlog::trace_enabled<grp::splitter>) {
            const std::string length = range.length ? fmt::format("{} bytes", *range.length) : "to end of file";
            devlog::trace<grp::splitter>("Track {:02d}: offset {}, {}", track.number, range.offset, length);
        }

        auto &output = outputs.emplace_back();
        output.name = SplitTrackFilename(basename, track.number, file.tracks.size());
        output.ranges.push_back(std::move(range));
    }
    return outputs;
}

CueResult Split(std::string_view cueText, std::string_view basename, const ParseOptions &options,
                SplitResult &result) {
    CueSheet sheet{};
    if (auto parseResult = ParseCueSheet(cueText, options, sheet); !parseResult) {
        return parseResult;
    }
    if (sheet.files.size() != 1) {
        return CueResult::InvalidOperation(
            fmt::format("split requires exactly one input file, but the sheet references {}", sheet.files.size()));
    }

    BinFile &file = sheet.files.front();
    result.cueText = GenerateSplitCueSheet(basename, file);
    result.outputs = ComputeSplitOutputs(basename, file, sheet.blocksize);
    result.file = std::move(file);
    result.blocksize = sheet.blocksize;

    devlog::info<grp::splitter>("Split \"{}\" into {} track file(s)", result.file.path, result.outputs.size());
    return CueResult::Success();
}

} // namespace cuedat::media::cue
