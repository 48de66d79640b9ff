#pragma once

/**
@file
@brief Result type returned by every cue sheet operation.
*/

#include <string>
#include <system_error>

namespace cuedat::media::cue {

/// @brief The outcome of a cue sheet operation.
///
/// Converts to `true` on success. On failure, `type` classifies the problem and `message` describes it, quoting the
/// offending input where there is one.
struct CueResult {
    enum class Type {
        Success,

        /// A timestamp or statement that cannot be interpreted geometrically.
        FormatError,

        /// A sheet that yields no usable FILE/TRACK structure.
        StructuralError,

        /// A valid sheet used with an operation whose precondition it violates.
        InvalidOperation,

        /// Sizes or offsets that are inconsistent with each other. Indicates a corrupt or non-standard dump.
        IntegrityError,

        /// The filesystem failed while reading or writing track data.
        IOError,
    };

    static CueResult Success() {
        return {};
    }

    static CueResult FormatError(std::string message) {
        return {.type = Type::FormatError, .message = std::move(message)};
    }

    static CueResult StructuralError(std::string message) {
        return {.type = Type::StructuralError, .message = std::move(message)};
    }

    static CueResult InvalidOperation(std::string message) {
        return {.type = Type::InvalidOperation, .message = std::move(message)};
    }

    static CueResult IntegrityError(std::string message) {
        return {.type = Type::IntegrityError, .message = std::move(message)};
    }

    static CueResult IOError(std::string message, std::error_code error) {
        return {.type = Type::IOError, .message = std::move(message), .error = error};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    /// @brief Formats the result for display, e.g. "Integrity error: ...".
    std::string string() const;

    Type type = Type::Success;
    std::string message;
    std::error_code error; ///< Underlying filesystem error, valid for `IOError` only
};

/// @brief Retrieves a human-readable name for the result type.
const char *ToString(CueResult::Type type);

} // namespace cuedat::media::cue
