#include <cuedat/media/timestamp.hpp>

#include <fmt/format.h>

#include <array>

namespace cuedat::media {

using cue::CueResult;

std::string SectorsToTimestamp(uint32 sectors) {
    const uint32 minutes = sectors / kFramesPerMinute;
    const uint32 seconds = (sectors / kFramesPerSecond) % 60;
    const uint32 frames = sectors % kFramesPerSecond;
    return fmt::format("{:02d}:{:02d}:{:02d}", minutes, seconds, frames);
}

CueResult TimestampToSectors(std::string_view stamp, uint32 &sectors) {
    auto fail = [&] { return CueResult::FormatError(fmt::format("Invalid timestamp format: \"{}\"", stamp)); };

    std::array<uint32, 3> fields{};
    size_t field = 0;
    size_t digits = 0;
    for (char c : stamp) {
        if (c >= '0' && c <= '9') {
            if (++digits > 2) {
                return fail();
            }
            fields[field] = fields[field] * 10 + static_cast<uint32>(c - '0');
        } else if (c == ':') {
            if (digits == 0 || ++field >= fields.size()) {
                return fail();
            }
            digits = 0;
        } else {
            return fail();
        }
    }
    if (field != fields.size() - 1 || digits == 0) {
        return fail();
    }

    sectors = TimestampToFrameAddress(fields[0], fields[1], fields[2]);
    return CueResult::Success();
}

} // namespace cuedat::media
