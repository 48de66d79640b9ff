#pragma once

/**
@file
@brief Loads Logiqx XML DAT files into a `Catalogue`.

Expected layout:

```xml
<datafile>
    <header>
        <name>Sony - PlayStation</name>
    </header>
    <game name="Game (USA)">
        <category>Games</category>
        <description>Game (USA)</description>
        <rom name="Game (USA).cue" size="1234" crc="..." md5="..." sha1="..."/>
        <rom name="Game (USA) (Track 1).bin" size="..." crc="..." md5="..." sha1="..."/>
    </game>
</datafile>
```
*/

#include "catalogue.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace cuedat::db {

/// @brief The outcome of loading a DAT file.
struct DatLoadResult {
    enum class Type {
        Success,
        FilesystemError,  ///< The file could not be read
        XMLParseError,    ///< The document is not well-formed XML
        MissingHeader,    ///< No `<header><name>` before the first game, or none at all
        InvalidStructure, ///< Unexpected element nesting
        InvalidRom,       ///< A `<rom>` or `<game>` lacks a required attribute or has a malformed size
    };

    static DatLoadResult Success() {
        return {.type = Type::Success};
    }

    static DatLoadResult FilesystemError(std::error_code error) {
        return {.type = Type::FilesystemError, .value = error};
    }

    static DatLoadResult XMLParseError(std::string message) {
        return {.type = Type::XMLParseError, .value = std::move(message)};
    }

    static DatLoadResult MissingHeader(std::string message) {
        return {.type = Type::MissingHeader, .value = std::move(message)};
    }

    static DatLoadResult InvalidStructure(std::string message) {
        return {.type = Type::InvalidStructure, .value = std::move(message)};
    }

    static DatLoadResult InvalidRom(std::string message) {
        return {.type = Type::InvalidRom, .value = std::move(message)};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;

    Type type;
    std::variant<std::monostate, std::error_code, std::string> value;
};

/// @brief Loads a DAT file.
///
/// On failure, `catalogue` is left untouched.
///
/// @param[in] path the DAT file
/// @param[out] catalogue receives the loaded catalogue on success
/// @return the result of the operation
DatLoadResult LoadDat(const std::filesystem::path &path, Catalogue &catalogue);

/// @brief Loads a DAT document from memory.
/// @param[in] xml the XML document
/// @param[out] catalogue receives the loaded catalogue on success
/// @return the result of the operation
DatLoadResult LoadDatFromMemory(std::string_view xml, Catalogue &catalogue);

} // namespace cuedat::db
