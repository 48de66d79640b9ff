#pragma once

/**
@file
@brief Locates the files of dumps and the reference cue sheets they are verified against.
*/

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cuedat::db {

/// @brief Collects the files of a dump.
///
/// If `input` is a directory, returns every regular file directly inside it, sorted by path. Entries whose type cannot
/// be determined (such as dangling links) are skipped. Otherwise `input` itself is the only file.
///
/// @param[in] input a dump directory or a single file
/// @param[out] error receives the error if `input` or the directory cannot be read, or is cleared on success
/// @return the files of the dump; empty on error
std::vector<std::filesystem::path> ListDumpFiles(const std::filesystem::path &input, std::error_code &error);

/// @brief A master copy of a game's cue sheet.
struct ReferenceCueSheet {
    std::string name;           ///< File name without the .cue extension, normally the game name
    std::filesystem::path path; ///< Where the sheet is stored; read only once a game needs it
};

/// @brief Finds every .cue file under a directory and its subdirectories.
///
/// The extension is matched case-insensitively. Sheets are returned sorted by path.
///
/// @param[in] dir the directory holding the master cue sheets
/// @param[out] error receives the error if the directory cannot be read, or is cleared on success
/// @return the sheets found; empty on error
std::vector<ReferenceCueSheet> ListReferenceCueSheets(const std::filesystem::path &dir, std::error_code &error);

/// @brief Picks the reference cue sheet for a game.
///
/// Candidates are tried in three passes, each in list order:
/// 1. a sheet named exactly `gameName`
/// 2. a sheet whose name equals `gameName` ignoring ASCII case
/// 3. a sheet whose name contains `gameName` or is contained in it, ignoring ASCII case
///
/// @param[in] sheets the available sheets
/// @param[in] gameName the name of the game in the catalogue
/// @return a pointer to the chosen entry of `sheets`, or `nullptr` if none fits
const ReferenceCueSheet *FindReferenceCueSheet(std::span<const ReferenceCueSheet> sheets, std::string_view gameName);

} // namespace cuedat::db
