#include <cuedat/media/cue/cue_generator.hpp>

#include <cuedat/media/cue/cue_line.hpp>
#include <cuedat/media/timestamp.hpp>

#include <fmt/format.h>

#include <cctype>
#include <iterator>
#include <variant>

namespace cuedat::media::cue {

// Writes the TRACK block of a track, rebasing every index point by the given signed delta.
static void WriteTrack(fmt::memory_buffer &out, const Track &track, sint64 delta) {
    fmt::format_to(std::back_inserter(out), "  TRACK {:02d} {}\n", track.number, track.trackType);
    if (track.pregap) {
        fmt::format_to(std::back_inserter(out), "    PREGAP {}\n", SectorsToTimestamp(*track.pregap));
    }
    for (const TrackIndex &index : track.indexes) {
        const auto offset = static_cast<uint32>(static_cast<sint64>(index.fileOffset) + delta);
        fmt::format_to(std::back_inserter(out), "    INDEX {:02d} {}\n", index.id, SectorsToTimestamp(offset));
    }
    if (track.postgap) {
        fmt::format_to(std::back_inserter(out), "    POSTGAP {}\n", SectorsToTimestamp(*track.postgap));
    }
}

std::string GenerateMergedCueSheet(std::string_view basename, std::span<const BinFile> files,
                                   std::span<const uint32> fileSectorOffsets) {
    fmt::memory_buffer out{};
    fmt::format_to(std::back_inserter(out), "FILE \"{}.bin\" BINARY\n", basename);
    for (size_t i = 0; i < files.size(); i++) {
        const uint32 base = i < fileSectorOffsets.size() ? fileSectorOffsets[i] : 0;
        for (const Track &track : files[i].tracks) {
            WriteTrack(out, track, base);
        }
    }
    return fmt::to_string(out);
}

std::string GenerateSplitCueSheet(std::string_view basename, const BinFile &file) {
    fmt::memory_buffer out{};
    for (const Track &track : file.tracks) {
        fmt::format_to(std::back_inserter(out), "FILE \"{}\" BINARY\n",
                       SplitTrackFilename(basename, track.number, file.tracks.size()));
        WriteTrack(out, track, -static_cast<sint64>(track.StartOffset()));
    }
    return fmt::to_string(out);
}

std::string SplitTrackFilename(std::string_view basename, uint32 trackNumber, size_t trackCount) {
    if (trackCount == 1) {
        return fmt::format("{}.bin", basename);
    }
    if (trackCount > 9) {
        return fmt::format("{} (Track {:02d}).bin", basename, trackNumber);
    }
    return fmt::format("{} (Track {}).bin", basename, trackNumber);
}

std::string NormalizeCueSheet(std::string_view text) {
    std::string out{};
    while (!text.empty()) {
        const size_t eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);

        if (std::holds_alternative<line::Ignored>(ClassifyLine(line))) {
            continue;
        }
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) {
            line.remove_prefix(1);
        }
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
            line.remove_suffix(1);
        }
        out.append(line);
        out.push_back('\n');
    }
    return out;
}

} // namespace cuedat::media::cue
