#pragma once

#include <cuedat/core/configuration.hpp>
#include <cuedat/core/types.hpp>

#include <fmt/format.h>
#include <toml++/toml.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <variant>

namespace app {

struct SettingsLoadResult {
    enum class Type { Success, TOMLParseError, UnsupportedConfigVersion, InvalidValue };

    static SettingsLoadResult Success() {
        return {.type = Type::Success};
    }

    static SettingsLoadResult TOMLParseError(toml::parse_error error) {
        return {.type = Type::TOMLParseError, .value = error};
    }

    static SettingsLoadResult UnsupportedConfigVersion(int version) {
        return {.type = Type::UnsupportedConfigVersion, .value = version};
    }

    static SettingsLoadResult InvalidValue(std::string message) {
        return {.type = Type::InvalidValue, .value = std::move(message)};
    }

    operator bool() const {
        return type == Type::Success;
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::TOMLParseError: //
        {
            auto &error = std::get<toml::parse_error>(value);
            std::ostringstream ss{};
            ss << error.source();
            return fmt::format("TOML parse error: {} (at {})", error.description(), ss.str());
        }
        case Type::UnsupportedConfigVersion:
            return fmt::format("Unsupported configuration version: {}", std::get<int>(value));
        case Type::InvalidValue: return fmt::format("Invalid value: {}", std::get<std::string>(value));
        default: return "Unspecified error";
        }
    }

    Type type;
    std::variant<std::monostate, toml::parse_error, int, std::string> value;
};

struct Settings {
    // Loads settings from the given path. Missing files leave the defaults in place.
    SettingsLoadResult Load(const std::filesystem::path &path);

    void ResetToDefaults();

    cuedat::core::Configuration core;

    struct General {
        // Number of files hashed in parallel. 0 uses one thread per hardware thread.
        uint32 hashThreads;
    } general;

    struct Verify {
        // Accept dumps whose cue sheet differs from the catalogue when there is no reference cue sheet to compare.
        bool allowCueMismatch;
    } verify;
};

} // namespace app
