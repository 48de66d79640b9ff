#include <cuedat/db/dat_loader.hpp>

#include "db_devlog.hpp"

#include <fmt/format.h>

#include <tinyxml2.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <iterator>
#include <utility>

namespace cuedat::db {

std::string DatLoadResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::FilesystemError:
        return fmt::format("Filesystem error: {}", std::get<std::error_code>(value).message());
    case Type::XMLParseError: return fmt::format("XML parse error: {}", std::get<std::string>(value));
    case Type::MissingHeader: return fmt::format("Missing header: {}", std::get<std::string>(value));
    case Type::InvalidStructure: return fmt::format("Invalid structure: {}", std::get<std::string>(value));
    case Type::InvalidRom: return fmt::format("Invalid entry: {}", std::get<std::string>(value));
    default: return "Unspecified error";
    }
}

static const char *ChildText(const tinyxml2::XMLElement *parent, const char *name) {
    const tinyxml2::XMLElement *child = parent->FirstChildElement(name);
    if (child == nullptr) {
        return nullptr;
    }
    const char *text = child->GetText();
    return text != nullptr ? text : "";
}

static std::string_view TrimText(std::string_view text) {
    constexpr std::string_view kSpaces = " \t\r\n";
    const size_t start = text.find_first_not_of(kSpaces);
    if (start == std::string_view::npos) {
        return {};
    }
    return text.substr(start, text.find_last_not_of(kSpaces) - start + 1);
}

static DatLoadResult ParseRom(const tinyxml2::XMLElement *elem, std::string_view gameName, Rom &rom) {
    const char *name = elem->Attribute("name");
    const char *size = elem->Attribute("size");
    const char *sha1 = elem->Attribute("sha1");
    for (auto [attrName, attrValue] : {std::pair{"name", name}, std::pair{"size", size}, std::pair{"sha1", sha1}}) {
        if (attrValue == nullptr || *attrValue == '\0') {
            return DatLoadResult::InvalidRom(
                fmt::format("Found a <rom> without a {} attribute in game \"{}\"", attrName, gameName));
        }
    }

    const char *sizeEnd = size + std::strlen(size);
    auto [ptr, ec] = std::from_chars(size, sizeEnd, rom.size);
    if (ec != std::errc{} || ptr != sizeEnd) {
        return DatLoadResult::InvalidRom(
            fmt::format("<rom> \"{}\" has a size attribute that is not an integer: {}", name, size));
    }

    rom.name = name;
    rom.sha1 = sha1;
    if (const char *crc = elem->Attribute("crc")) {
        rom.crc32 = crc;
    }
    if (const char *md5 = elem->Attribute("md5")) {
        rom.md5 = md5;
    }
    return DatLoadResult::Success();
}

static DatLoadResult ParseGame(const tinyxml2::XMLElement *elem, Game &game) {
    const char *name = elem->Attribute("name");
    if (name == nullptr || *name == '\0') {
        return DatLoadResult::InvalidRom("Found a <game> without a name attribute");
    }
    game.name = name;

    if (const char *description = ChildText(elem, "description")) {
        game.description = std::string{TrimText(description)};
    }
    if (const char *category = ChildText(elem, "category")) {
        game.category = std::string{TrimText(category)};
    }

    for (auto *child = elem->FirstChildElement(); child != nullptr; child = child->NextSiblingElement()) {
        const std::string_view childName = child->Name();
        if (childName == "game") {
            return DatLoadResult::InvalidStructure(fmt::format("Found a <game> within <game> \"{}\"", game.name));
        }
        if (childName != "rom") {
            continue;
        }
        if (auto result = ParseRom(child, game.name, game.roms.emplace_back()); !result) {
            return result;
        }
    }
    return DatLoadResult::Success();
}

DatLoadResult LoadDatFromMemory(std::string_view xml, Catalogue &catalogue) {
    tinyxml2::XMLDocument doc{};
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        return DatLoadResult::XMLParseError(fmt::format("{} (line {})", doc.ErrorStr(), doc.ErrorLineNum()));
    }

    const tinyxml2::XMLElement *root = doc.RootElement();
    if (root == nullptr || std::string_view{root->Name()} != "datafile") {
        return DatLoadResult::InvalidStructure("The root element is not <datafile>");
    }

    Catalogue newCatalogue{};
    bool hasHeader = false;
    for (auto *elem = root->FirstChildElement(); elem != nullptr; elem = elem->NextSiblingElement()) {
        const std::string_view elemName = elem->Name();
        if (elemName == "header") {
            if (const char *name = ChildText(elem, "name")) {
                newCatalogue.systemName = std::string{TrimText(name)};
                hasHeader = true;
            }
        } else if (elemName == "game") {
            if (!hasHeader) {
                return DatLoadResult::MissingHeader("Found a <game> before the <header> was parsed");
            }
            Game game{};
            if (auto result = ParseGame(elem, game); !result) {
                return result;
            }
            newCatalogue.AddGame(std::move(game));
        }
    }

    if (!hasHeader) {
        return DatLoadResult::MissingHeader("No <header> with a <name> was found");
    }

    devlog::info<grp::dat>("Loaded {} game(s) for {}", newCatalogue.GameCount(), newCatalogue.systemName);
    catalogue = std::move(newCatalogue);
    return DatLoadResult::Success();
}

DatLoadResult LoadDat(const std::filesystem::path &path, Catalogue &catalogue) {
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        return DatLoadResult::FilesystemError(std::error_code{errno, std::generic_category()});
    }
    const std::string xml{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return DatLoadResult::FilesystemError(std::make_error_code(std::errc::io_error));
    }

    devlog::debug<grp::dat>("Parsing {} bytes of DAT data", xml.size());
    return LoadDatFromMemory(xml, catalogue);
}

} // namespace cuedat::db
