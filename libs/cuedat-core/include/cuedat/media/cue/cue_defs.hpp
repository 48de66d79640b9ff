#pragma once

/**
@file
@brief Cue sheet geometry: files, tracks and index points.
*/

#include <cuedat/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cuedat::media::cue {

/// @brief An INDEX point within a track.
struct TrackIndex {
    uint32 id = 0;         ///< INDEX number. 00 marks the pregap, 01 the start of playable data
    std::string stamp;     ///< The MM:SS:FF timestamp as written in the sheet
    uint32 fileOffset = 0; ///< `stamp` converted to sectors, relative to the start of the owning file

    bool operator==(const TrackIndex &) const = default;
};

/// @brief A TRACK statement and everything that belongs to it.
struct Track {
    uint32 number = 0;               ///< 1-based track number
    std::string trackType;           ///< Type token as written, e.g. "AUDIO" or "MODE1/2352"
    std::vector<TrackIndex> indexes; ///< Index points in sheet order

    /// Length of the track in sectors. Derived by `BackfillSectorCounts`; absent until then.
    std::optional<uint32> sectorCount;

    std::optional<uint32> pregap;  ///< PREGAP length in sectors, if declared
    std::optional<uint32> postgap; ///< POSTGAP length in sectors, if declared

    /// @brief The offset of the first index point, which is where the track's data begins in its file.
    uint32 StartOffset() const {
        return indexes.empty() ? 0 : indexes.front().fileOffset;
    }

    bool operator==(const Track &) const = default;
};

/// @brief A FILE statement and the tracks stored in that file.
struct BinFile {
    std::string path;          ///< Path as written in the sheet, prefixed with the base path when one was given
    std::string format;        ///< File type token, normally "BINARY"
    uintmax_t size = 0;        ///< Size of the file in bytes; 0 when unknown
    std::vector<Track> tracks; ///< Tracks in sheet order

    bool operator==(const BinFile &) const = default;
};

/// @brief A parsed cue sheet.
struct CueSheet {
    std::vector<BinFile> files;
    uint32 blocksize = 2352; ///< The blocksize locked in while parsing
};

/// @brief A run of bytes to copy from a source file.
struct ByteRange {
    std::string sourcePath;
    uintmax_t offset = 0;

    /// Number of bytes to copy. Absent means "up to the end of the source file".
    std::optional<uintmax_t> length;

    bool operator==(const ByteRange &) const = default;
};

/// @brief An output file produced by a merge or split, described as a sequence of byte ranges.
struct OutputFile {
    std::string name;
    std::vector<ByteRange> ranges;
};

} // namespace cuedat::media::cue
