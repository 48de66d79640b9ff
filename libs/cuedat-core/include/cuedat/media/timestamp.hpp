#pragma once

/**
@file
@brief Conversions between sector counts and CD MM:SS:FF timestamps.
*/

#include <cuedat/core/types.hpp>

#include <cuedat/media/cue/cue_result.hpp>

#include <string>
#include <string_view>

namespace cuedat::media {

inline constexpr uint32 kFramesPerSecond = 75;
inline constexpr uint32 kFramesPerMinute = kFramesPerSecond * 60;

/// @brief Converts a MM:SS:FF timestamp into the corresponding sector count.
/// @param[in] min the minutes
/// @param[in] sec the seconds
/// @param[in] frame the frames
/// @return the number of sectors from 00:00:00 to MM:SS:FF
constexpr uint32 TimestampToFrameAddress(uint32 min, uint32 sec, uint32 frame) {
    return min * kFramesPerMinute + sec * kFramesPerSecond + frame;
}

/// @brief Formats a sector count as a MM:SS:FF timestamp.
///
/// Every field is zero-padded to two digits. Minutes are not capped and render with three or more digits past 99.
///
/// @param[in] sectors the sector count
/// @return the timestamp
std::string SectorsToTimestamp(uint32 sectors);

/// @brief Parses a MM:SS:FF timestamp.
///
/// Only the exact shape `\d{1,2}:\d{1,2}:\d{1,2}` is accepted. Anything else, including surrounding whitespace, fails
/// with a `FormatError` whose message quotes `stamp`.
///
/// @param[in] stamp the timestamp text
/// @param[out] sectors receives the sector count on success; left untouched on failure
/// @return the result of the conversion
cue::CueResult TimestampToSectors(std::string_view stamp, uint32 &sectors);

} // namespace cuedat::media
