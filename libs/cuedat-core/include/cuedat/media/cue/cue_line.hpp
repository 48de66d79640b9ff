#pragma once

/**
@file
@brief Classifies individual cue sheet lines before any geometry is computed.
*/

#include <cuedat/core/types.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace cuedat::media::cue {

namespace line {

    /// @brief FILE "name" TYPE
    struct File {
        std::string name;
        std::string format;
    };

    /// @brief TRACK nn TYPE
    struct Track {
        uint32 number;
        std::string trackType;
    };

    /// @brief INDEX nn MM:SS:FF
    ///
    /// The timestamp is kept verbatim and validated by the parser, which reports malformed stamps.
    struct Index {
        uint32 id;
        std::string stamp;
    };

    /// @brief PREGAP MM:SS:FF
    struct Pregap {
        std::string stamp;
    };

    /// @brief POSTGAP MM:SS:FF
    struct Postgap {
        std::string stamp;
    };

    /// @brief Any other statement (REM, CATALOG, TITLE, FLAGS, ...), blank lines and malformed statements.
    struct Ignored {};

} // namespace line

/// @brief A classified cue sheet line.
using CueLine = std::variant<line::File, line::Track, line::Index, line::Pregap, line::Postgap, line::Ignored>;

/// @brief Classifies a single cue sheet line.
///
/// Keywords are matched case-insensitively; "track 01 audio" is a TRACK statement. Leading and trailing whitespace
/// (including the `\r` of CRLF line endings) is ignored. Statements missing a required operand are `Ignored`.
///
/// @param[in] text the line, without the line terminator
/// @return the classified line
CueLine ClassifyLine(std::string_view text);

} // namespace cuedat::media::cue
