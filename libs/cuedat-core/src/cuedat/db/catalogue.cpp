#include <cuedat/db/catalogue.hpp>

#include <algorithm>
#include <cctype>

namespace cuedat::db {

std::string ToLower(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return out;
}

void Catalogue::AddGame(Game game) {
    const size_t gameIndex = m_games.size();
    for (size_t romIndex = 0; romIndex < game.roms.size(); romIndex++) {
        Rom &rom = game.roms[romIndex];
        rom.sha1 = ToLower(rom.sha1);
        m_romsBySha1[rom.sha1].push_back({.gameIndex = gameIndex, .romIndex = romIndex});
    }
    m_games.push_back(std::move(game));
}

std::span<const RomLocation> Catalogue::FindBySha1(std::string_view sha1) const {
    auto it = m_romsBySha1.find(ToLower(sha1));
    if (it == m_romsBySha1.end()) {
        return {};
    }
    return it->second;
}

} // namespace cuedat::db
