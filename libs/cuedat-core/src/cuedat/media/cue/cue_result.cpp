#include <cuedat/media/cue/cue_result.hpp>

#include <cuedat/util/unreachable.hpp>

#include <fmt/format.h>

namespace cuedat::media::cue {

const char *ToString(CueResult::Type type) {
    switch (type) {
    case CueResult::Type::Success: return "Success";
    case CueResult::Type::FormatError: return "Format error";
    case CueResult::Type::StructuralError: return "Structural error";
    case CueResult::Type::InvalidOperation: return "Invalid operation";
    case CueResult::Type::IntegrityError: return "Integrity error";
    case CueResult::Type::IOError: return "I/O error";
    }
    util::unreachable();
}

std::string CueResult::string() const {
    if (type == Type::Success) {
        return ToString(type);
    }
    if (type == Type::IOError && error) {
        return fmt::format("{}: {} ({})", ToString(type), message, error.message());
    }
    return fmt::format("{}: {}", ToString(type), message);
}

} // namespace cuedat::media::cue
