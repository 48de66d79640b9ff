#pragma once

#include <cuedat/util/dev_log.hpp>

namespace cuedat::media::cue::grp {

// -----------------------------------------------------------------------------
// Dev log groups

// Hierarchy:
//
// base
//   parser
//   merger
//   splitter
//   writer

struct base {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "Cue";
};

struct parser : public base {
    static constexpr std::string_view name = "Cue-Parser";
};

struct merger : public base {
    static constexpr std::string_view name = "Cue-Merger";
};

struct splitter : public base {
    static constexpr std::string_view name = "Cue-Splitter";
};

struct writer : public base {
    static constexpr std::string_view name = "Image-Writer";
};

} // namespace cuedat::media::cue::grp
