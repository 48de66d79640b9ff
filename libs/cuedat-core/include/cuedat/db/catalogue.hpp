#pragma once

/**
@file
@brief Reference catalogue of known games and the files that make them up.
*/

#include <cuedat/core/types.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cuedat::db {

/// @brief A file belonging to a game, as listed in a DAT.
struct Rom {
    std::string name;  ///< File name, e.g. "Game (USA) (Track 1).bin"
    uint64 size = 0;   ///< Size in bytes
    std::string sha1;  ///< Lowercase hex SHA-1
    std::optional<std::string> crc32;
    std::optional<std::string> md5;
};

/// @brief A game and its files.
struct Game {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> category;
    std::vector<Rom> roms;
};

/// @brief Position of a ROM within the catalogue.
struct RomLocation {
    size_t gameIndex;
    size_t romIndex;
};

/// @brief A collection of games indexed by file content hash.
///
/// Games are kept in insertion order, which is the order used to break ties when matching. Once loaded the catalogue
/// is only read from and can be shared between threads.
class Catalogue {
public:
    /// @brief Adds a game and indexes its ROMs by SHA-1.
    ///
    /// ROM hashes are normalized to lowercase.
    ///
    /// @param[in] game the game to add
    void AddGame(Game game);

    /// @brief Finds every ROM with the given SHA-1. The lookup is case-insensitive.
    /// @param[in] sha1 the hex SHA-1 to look up
    /// @return the locations of the matching ROMs, possibly empty
    std::span<const RomLocation> FindBySha1(std::string_view sha1) const;

    /// @brief Retrieves a game by index.
    const Game &GetGame(size_t index) const {
        return m_games[index];
    }

    /// @brief Retrieves a ROM by location.
    const Rom &GetRom(const RomLocation &location) const {
        return m_games[location.gameIndex].roms[location.romIndex];
    }

    /// @brief Retrieves all games in insertion order.
    std::span<const Game> Games() const {
        return m_games;
    }

    size_t GameCount() const {
        return m_games.size();
    }

    /// @brief The name of the system this catalogue describes, e.g. "Sony - PlayStation".
    std::string systemName;

private:
    std::vector<Game> m_games;
    std::unordered_map<std::string, std::vector<RomLocation>> m_romsBySha1;
};

/// @brief Converts ASCII letters to lowercase.
std::string ToLower(std::string_view text);

} // namespace cuedat::db
