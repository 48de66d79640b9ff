#pragma once

#include <cuedat/util/dev_log.hpp>

namespace cuedat::db::grp {

// -----------------------------------------------------------------------------
// Dev log groups

// Hierarchy:
//
// base
//   dat
//   matcher
//   verifier
//   dumps

struct base {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "DB";
};

struct dat : public base {
    static constexpr std::string_view name = "DB-DAT";
};

struct matcher : public base {
    static constexpr std::string_view name = "DB-Matcher";
};

struct verifier : public base {
    static constexpr std::string_view name = "DB-Verifier";
};

struct dumps : public base {
    static constexpr std::string_view name = "DB-Dumps";
};

} // namespace cuedat::db::grp
