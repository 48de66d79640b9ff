#include <cuedat/media/track_type.hpp>

#include <cuedat/util/unreachable.hpp>

#include <array>
#include <utility>

namespace cuedat::media {

// clang-format off
static constexpr std::array<std::pair<std::string_view, TrackType>, 8> kTrackTypes{{
    {"AUDIO",      TrackType::Audio},
    {"MODE1/2352", TrackType::Mode1_2352},
    {"MODE2/2352", TrackType::Mode2_2352},
    {"CDI/2352",   TrackType::CDI_2352},
    {"CDG",        TrackType::CDG},
    {"MODE1/2048", TrackType::Mode1_2048},
    {"MODE2/2336", TrackType::Mode2_2336},
    {"CDI/2336",   TrackType::CDI_2336},
}};
// clang-format on

TrackType ParseTrackType(std::string_view token) {
    for (auto &[name, type] : kTrackTypes) {
        if (name == token) {
            return type;
        }
    }
    return TrackType::Unknown;
}

uint32 BlockSizeOf(TrackType type) {
    switch (type) {
    case TrackType::Audio: [[fallthrough]];
    case TrackType::Mode1_2352: [[fallthrough]];
    case TrackType::Mode2_2352: [[fallthrough]];
    case TrackType::CDI_2352: return 2352;
    case TrackType::CDG: return 2448;
    case TrackType::Mode1_2048: return 2048;
    case TrackType::Mode2_2336: [[fallthrough]];
    case TrackType::CDI_2336: return 2336;
    case TrackType::Unknown: return kDefaultBlocksize;
    }
    util::unreachable();
}

} // namespace cuedat::media
