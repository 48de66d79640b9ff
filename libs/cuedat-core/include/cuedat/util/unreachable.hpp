#pragma once

/**
@file
@brief Defines the `util::unreachable()` function that marks code as unreachable.
*/

namespace util {

/// @brief Marks a point in code as unreachable, such as the end of a switch that covers every enumerator.
[[noreturn]] inline void unreachable() {
#if defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
    __builtin_unreachable();
#elif defined(_MSC_VER)
    __assume(0);
#endif
}

} // namespace util
