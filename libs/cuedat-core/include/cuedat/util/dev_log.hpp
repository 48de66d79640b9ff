#pragma once

/**
@file
@brief A simple logging mechanism to trace what the library does with a cue sheet or catalogue.

Uses compile-time enable/disable flags so that disabled logs cost nothing. Enable with the `CueDat_ENABLE_DEVLOG`
CMake option.

Messages go to stderr. Not meant to be used for user-facing output; applications print their own messages.

@section Usage

Define groups:

```cpp
namespace grp {
    struct base {
        static constexpr bool enabled = true;                        // whether the log group is enabled
        static constexpr devlog::Level level = devlog::level::debug; // the minimum logging level to be printed
        static constexpr std::string_view name = "Cue";              // the group's name printed before the message
    };

    struct parser : public base {
        static constexpr std::string_view name = "Cue-Parser";
    };
}
```

Log messages with {fmt} formatting:

```cpp
devlog::debug<grp::parser>("Locked blocksize to {}", blocksize);
```
*/

/**
@namespace devlog
@brief Development logging utilities.
*/

#include <cuedat/core/types.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstdio>
#include <string_view>

namespace devlog {

/// @brief Globally enable or disable dev logging.
inline constexpr bool globalEnable = CueDat_ENABLE_DEVLOG;

/// @brief Log level type - a simple integer type.
using Level = uint32;

/// @brief Dev log levels definitions.
namespace level {
    /// @brief Fine-grained details such as every classified cue line.
    inline constexpr Level trace = 1;

    /// @brief Decisions taken while processing an input, such as locking the blocksize.
    inline constexpr Level debug = 2;

    /// @brief Summaries of completed operations.
    inline constexpr Level info = 3;

    /// @brief Unusual inputs that were handled with a reasonable default.
    inline constexpr Level warn = 4;

    /// @brief Inputs that were rejected.
    inline constexpr Level error = 5;

    /// @brief Not a valid log level. Disables logging for a group.
    inline constexpr Level off = 6;

    /// @brief The name for a given log level.
    /// @tparam level the log level
    template <Level level>
    inline constexpr const char *name = "unk";

    template <>
    inline constexpr const char *name<trace> = "trace";
    template <>
    inline constexpr const char *name<debug> = "debug";
    template <>
    inline constexpr const char *name<info> = "info";
    template <>
    inline constexpr const char *name<warn> = "warn";
    template <>
    inline constexpr const char *name<error> = "error";
} // namespace level

namespace detail {

    /// @brief Describes a log group with a static name.
    template <typename T>
    concept Group = requires() {
        requires std::same_as<std::decay_t<decltype(T::enabled)>, bool>;
        requires std::same_as<std::decay_t<decltype(T::level)>, Level>;
        requires std::same_as<std::decay_t<decltype(T::name)>, std::string_view>;
    };

    /// @brief Determines if logging is enabled for the level `level` in the group `TGroup`.
    template <Level level, Group TGroup>
    inline constexpr bool enabled = globalEnable && TGroup::enabled && level >= TGroup::level;

    template <Level level, Group TGroup, typename... TArgs>
    constexpr void log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        static_assert(level < level::off);
        if constexpr (enabled<level, TGroup>) {
            fmt::print(stderr, "{:5s} | {:16s} | ", level::name<level>, TGroup::name);
            fmt::println(stderr, fmt, static_cast<TArgs &&>(args)...);
        }
    }

} // namespace detail

/// @brief Determines if trace logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool trace_enabled = detail::enabled<level::trace, TGroup>;

template <detail::Group TGroup, typename... TArgs>
constexpr void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::trace, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::debug, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::info, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::warn, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
constexpr void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::error, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

} // namespace devlog
