#pragma once

/**
@file
@brief Defines `util::ScopeGuard`, an utility type that executes code on scope exit.
*/

#include <utility>

namespace util {

/// @brief A type that performs an operation on scope exit unless cancelled.
///
/// Typical use is undoing partial work on failure paths:
///
/// ```cpp
/// std::ofstream out{path, std::ios::binary};
/// ScopeGuard sgRemoveOutput{[&] { out.close(); std::filesystem::remove(path, ec); }};
/// // ... write everything; return early on failure ...
/// sgRemoveOutput.Cancel(); // keep the file
/// ```
///
/// @tparam Fn the type of the scope guard function
template <typename Fn>
class ScopeGuard {
public:
    /// @brief Creates a scope guard with the given function.
    /// @param[in] fn the function
    ScopeGuard(Fn &&fn) noexcept
        : m_fn(std::move(fn)) {}

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;

    /// @brief Invokes the scope guard function if not cancelled.
    ~ScopeGuard() noexcept(noexcept(m_fn())) {
        if (m_armed) {
            m_fn();
        }
    }

    /// @brief Cancels the scope guard. Call once the guarded work has been committed.
    void Cancel() noexcept {
        m_armed = false;
    }

private:
    Fn m_fn;
    bool m_armed = true;
};

} // namespace util
