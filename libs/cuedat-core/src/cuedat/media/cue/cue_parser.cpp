#include <cuedat/media/cue/cue_parser.hpp>

#include <cuedat/media/cue/cue_line.hpp>
#include <cuedat/media/timestamp.hpp>

#include "cue_devlog.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <variant>

namespace cuedat::media::cue {

namespace {

    // Accumulator threaded through the line-by-line parse.
    struct ParseState {
        const ParseOptions &options;
        std::vector<BinFile> files;
        uint32 blocksize;
        bool hasTrack = false;  // whether the current file has an open TRACK
        uint32 lastOffset = 0;  // offset of the last INDEX seen in the current file
        uint32 lineNum = 0;

        CueResult operator()(line::File &&stmt) {
            auto &file = files.emplace_back();
            if (options.basePath.empty()) {
                file.path = std::move(stmt.name);
            } else {
                file.path = (std::filesystem::path{options.basePath} / stmt.name).generic_string();
            }
            file.format = std::move(stmt.format);
            if (options.sizeProvider) {
                file.size = options.sizeProvider(file.path);
            }
            hasTrack = false;
            lastOffset = 0;
            devlog::trace<grp::parser>("File {} - {} bytes (line {})", file.path, file.size, lineNum);
            return CueResult::Success();
        }

        CueResult operator()(line::Track &&stmt) {
            if (files.empty()) {
                devlog::debug<grp::parser>("Dropping TRACK {:02d} without a FILE (line {})", stmt.number, lineNum);
                return CueResult::Success();
            }

            // Only the first type with a non-default sector size is taken into account
            if (blocksize == kDefaultBlocksize) {
                const uint32 trackBlocksize = ResolveBlocksize(stmt.trackType);
                if (trackBlocksize != kDefaultBlocksize) {
                    blocksize = trackBlocksize;
                    devlog::debug<grp::parser>("Locked blocksize to {} (line {})", blocksize, lineNum);
                }
            }

            auto &track = files.back().tracks.emplace_back();
            track.number = stmt.number;
            track.trackType = std::move(stmt.trackType);
            hasTrack = true;
            return CueResult::Success();
        }

        CueResult operator()(line::Index &&stmt) {
            if (!hasTrack) {
                devlog::debug<grp::parser>("Dropping INDEX {:02d} without a TRACK (line {})", stmt.id, lineNum);
                return CueResult::Success();
            }

            uint32 offset{};
            if (auto result = TimestampToSectors(stmt.stamp, offset); !result) {
                return result;
            }
            if (offset < lastOffset) {
                return CueResult::IntegrityError(
                    fmt::format("INDEX {:02d} {} on line {} comes before the previous index point in \"{}\"", stmt.id,
                                stmt.stamp, lineNum, files.back().path));
            }
            lastOffset = offset;

            auto &indexes = files.back().tracks.back().indexes;
            indexes.push_back(TrackIndex{.id = stmt.id, .stamp = std::move(stmt.stamp), .fileOffset = offset});
            return CueResult::Success();
        }

        CueResult operator()(line::Pregap &&stmt) {
            return ParseGap(stmt.stamp, &Track::pregap);
        }

        CueResult operator()(line::Postgap &&stmt) {
            return ParseGap(stmt.stamp, &Track::postgap);
        }

        CueResult operator()(line::Ignored &&) {
            return CueResult::Success();
        }

        CueResult ParseGap(std::string_view stamp, std::optional<uint32> Track::*gap) {
            if (!hasTrack) {
                return CueResult::Success();
            }
            uint32 length{};
            if (auto result = TimestampToSectors(stamp, length); !result) {
                return result;
            }
            files.back().tracks.back().*gap = length;
            return CueResult::Success();
        }
    };

} // namespace

CueResult ParseCueSheet(std::string_view text, const ParseOptions &options, CueSheet &sheet) {
    ParseState state{.options = options, .blocksize = options.blocksize};

    while (!text.empty()) {
        const size_t eol = text.find('\n');
        const std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        state.lineNum++;

        if (auto result = std::visit(state, ClassifyLine(line)); !result) {
            devlog::error<grp::parser>("{}", result.message);
            return result;
        }
    }

    if (state.files.empty()) {
        return CueResult::StructuralError("Unable to parse any bin files in the cue sheet. Is the sheet empty?");
    }
    for (const auto &file : state.files) {
        for (const auto &track : file.tracks) {
            if (track.indexes.empty()) {
                return CueResult::StructuralError(
                    fmt::format("Track {:02d} in \"{}\" has no INDEX statement", track.number, file.path));
            }
        }
    }

    // A single file holds every track back-to-back and is a candidate for splitting
    if (state.files.size() == 1) {
        if (auto result = BackfillSectorCounts(state.files.front(), state.blocksize); !result) {
            return result;
        }
    }

    devlog::debug<grp::parser>("Parsed {} file(s) with blocksize {}", state.files.size(), state.blocksize);

    sheet.files = std::move(state.files);
    sheet.blocksize = state.blocksize;
    return CueResult::Success();
}

CueResult BackfillSectorCounts(BinFile &file, uint32 blocksize) {
    if (file.size == 0) {
        return CueResult::Success();
    }
    if (file.size % blocksize != 0) {
        return CueResult::IntegrityError(fmt::format(
            "Size of \"{}\" ({} bytes) is not a multiple of the {}-byte blocksize", file.path, file.size, blocksize));
    }

    uintmax_t nextOffset = file.size / blocksize;
    for (auto it = file.tracks.rbegin(); it != file.tracks.rend(); ++it) {
        const uint32 start = it->StartOffset();
        if (start > nextOffset) {
            return CueResult::IntegrityError(
                fmt::format("Track {:02d} in \"{}\" starts at sector {}, past the end of its data at sector {}",
                            it->number, file.path, start, nextOffset));
        }
        it->sectorCount = static_cast<uint32>(nextOffset - start);
        nextOffset = start;
    }
    return CueResult::Success();
}

} // namespace cuedat::media::cue
