#pragma once

/**
@file
@brief Track types found in cue sheets and their sector sizes.
*/

#include <cuedat/core/types.hpp>

#include <string_view>

namespace cuedat::media {

/// @brief The sector size of audio tracks and raw CD-ROM data tracks.
inline constexpr uint32 kDefaultBlocksize = 2352;

/// @brief Track types understood by the blocksize resolver.
enum class TrackType {
    Audio,      ///< AUDIO
    Mode1_2352, ///< MODE1/2352
    Mode2_2352, ///< MODE2/2352
    CDI_2352,   ///< CDI/2352
    CDG,        ///< CDG (karaoke CD+G, 96 bytes of subchannel data per sector)
    Mode1_2048, ///< MODE1/2048
    Mode2_2336, ///< MODE2/2336
    CDI_2336,   ///< CDI/2336

    /// Anything else. Hand-edited cue sheets contain all sorts of labels; these are treated as raw 2352-byte sectors.
    Unknown,
};

/// @brief Maps a TRACK type token to a `TrackType`. The comparison is case-sensitive.
/// @param[in] token the token, e.g. "MODE1/2352"
/// @return the matching type or `TrackType::Unknown`
TrackType ParseTrackType(std::string_view token);

/// @brief Retrieves the sector size of a track type.
/// @param[in] type the track type
/// @return the size of one sector in bytes
uint32 BlockSizeOf(TrackType type);

/// @brief Shorthand for `BlockSizeOf(ParseTrackType(token))`.
inline uint32 ResolveBlocksize(std::string_view token) {
    return BlockSizeOf(ParseTrackType(token));
}

} // namespace cuedat::media
