#include <cuedat/media/image_writer.hpp>

#include <cuedat/media/binary_reader/binary_reader_impl.hpp>

#include <cuedat/util/scope_guard.hpp>

#include "cue/cue_devlog.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <array>
#include <cerrno>
#include <fstream>
#include <memory>

namespace cuedat::media {

using cue::CueResult;
namespace grp = cue::grp;

static constexpr size_t kCopyChunkSize = 1024 * 1024;

CueResult WriteOutputFile(const cue::OutputFile &output, const std::filesystem::path &outputDir) {
    const std::filesystem::path outPath = outputDir / output.name;

    // Truncating the output must never destroy a source it is about to be built from
    for (const cue::ByteRange &range : output.ranges) {
        std::error_code error{};
        if (!std::filesystem::equivalent(range.sourcePath, outPath, error)) {
            continue;
        }
        const uintmax_t size = std::filesystem::file_size(outPath, error);
        const bool wholeFile = range.offset == 0 && (!range.length || (!error && *range.length == size));
        if (output.ranges.size() == 1 && wholeFile) {
            devlog::debug<grp::writer>("{} is already in place", outPath);
            return CueResult::Success();
        }
        return CueResult::InvalidOperation(
            fmt::format("Output \"{}\" is also one of its sources and would be overwritten", outPath));
    }

    std::ofstream out{outPath, std::ios::binary | std::ios::trunc};
    if (!out) {
        return CueResult::IOError(fmt::format("Could not create \"{}\"", outPath),
                                  std::error_code{errno, std::generic_category()});
    }
    util::ScopeGuard sgRemoveOutput{[&] {
        out.close();
        std::error_code ec{};
        std::filesystem::remove(outPath, ec);
    }};

    auto buffer = std::make_unique<std::array<uint8, kCopyChunkSize>>();
    uintmax_t totalWritten = 0;

    for (const cue::ByteRange &range : output.ranges) {
        std::error_code error{};
        std::shared_ptr<IBinaryReader> source = OpenBinaryReader(range.sourcePath, error);
        if (!source) {
            return CueResult::IOError(fmt::format("Could not open \"{}\"", range.sourcePath), error);
        }

        const uintmax_t sourceSize = source->Size();
        const uintmax_t length = range.length.value_or(range.offset <= sourceSize ? sourceSize - range.offset : 0);
        if (range.offset > sourceSize || length > sourceSize - range.offset) {
            return CueResult::IntegrityError(
                fmt::format("\"{}\" is {} bytes long, too short for the {} bytes expected at offset {}",
                            range.sourcePath, sourceSize, length, range.offset));
        }

        const SharedSubviewBinaryReader view{source, range.offset, length};
        uintmax_t position = 0;
        while (position < view.Size()) {
            const uintmax_t read = view.Read(position, kCopyChunkSize, *buffer);
            if (read == 0) {
                return CueResult::IntegrityError(
                    fmt::format("Unexpected end of data in \"{}\" at offset {}", range.sourcePath,
                                range.offset + position));
            }
            out.write(reinterpret_cast<const char *>(buffer->data()), static_cast<std::streamsize>(read));
            if (!out) {
                return CueResult::IOError(fmt::format("Could not write to \"{}\"", outPath),
                                          std::error_code{errno, std::generic_category()});
            }
            position += read;
        }
        totalWritten += position;
        devlog::trace<grp::writer>("Copied {} bytes from \"{}\" at offset {}", position, range.sourcePath,
                                   range.offset);
    }

    out.flush();
    if (!out) {
        return CueResult::IOError(fmt::format("Could not write to \"{}\"", outPath),
                                  std::error_code{errno, std::generic_category()});
    }

    sgRemoveOutput.Cancel();
    devlog::debug<grp::writer>("Wrote {} ({} bytes)", outPath, totalWritten);
    return CueResult::Success();
}

} // namespace cuedat::media
