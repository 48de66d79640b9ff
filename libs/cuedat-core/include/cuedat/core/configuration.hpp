#pragma once

/**
@file
@brief Defines `cuedat::core::Configuration` for tuning the cue and catalogue operations.
*/

#include <cuedat/core/types.hpp>

#include <string>

namespace cuedat::core {

/// @brief Library configuration.
///
/// The defaults reproduce the behavior expected by Redump-style dumps. Applications typically load overrides from a
/// settings file before running any operation.
struct Configuration {
    /// @brief Cue sheet parsing configuration.
    struct Cue {
        /// @brief Blocksize assumed until a track type with a different sector size is seen.
        uint32 defaultBlocksize = 2352;
    } cue;

    /// @brief Catalogue matcher configuration.
    struct Matcher {
        /// @brief Maximum byte difference accepted by the closest-track-size tier, exclusive.
        ///
        /// Candidates whose total track size differs from every game by this much or more are reported as unmatched.
        uint64 closestSizeThreshold = 1000;

        /// @brief Extension of the files counted as track data by the size tiers. Compared case-insensitively.
        std::string trackExtension = ".bin";
    } matcher;
};

} // namespace cuedat::core
