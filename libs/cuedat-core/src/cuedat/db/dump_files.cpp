#include <cuedat/db/dump_files.hpp>

#include <cuedat/db/catalogue.hpp>
#include <cuedat/db/catalogue_matcher.hpp>

#include "db_devlog.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>

namespace fs = std::filesystem;

namespace cuedat::db {

std::vector<fs::path> ListDumpFiles(const fs::path &input, std::error_code &error) {
    std::vector<fs::path> files{};
    error.clear();
    if (!fs::is_directory(input, error)) {
        if (!error) {
            files.push_back(input);
        }
        return files;
    }

    fs::directory_iterator it{input, error};
    for (; !error && it != fs::directory_iterator{}; it.increment(error)) {
        std::error_code typeError{};
        if (it->is_regular_file(typeError)) {
            files.push_back(it->path());
        } else if (typeError) {
            devlog::debug<grp::dumps>("Skipping {}: {}", it->path(), typeError.message());
        }
    }
    if (error) {
        return {};
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<ReferenceCueSheet> ListReferenceCueSheets(const fs::path &dir, std::error_code &error) {
    std::vector<ReferenceCueSheet> sheets{};
    fs::recursive_directory_iterator it{dir, error};
    for (; !error && it != fs::recursive_directory_iterator{}; it.increment(error)) {
        std::error_code typeError{};
        if (!it->is_regular_file(typeError) || !HasExtension(it->path().filename().string(), ".cue")) {
            continue;
        }
        sheets.push_back({.name = it->path().stem().string(), .path = it->path()});
    }
    if (error) {
        return {};
    }
    std::sort(sheets.begin(), sheets.end(),
              [](const ReferenceCueSheet &lhs, const ReferenceCueSheet &rhs) { return lhs.path < rhs.path; });
    devlog::debug<grp::dumps>("Found {} reference cue sheet(s) in {}", sheets.size(), dir);
    return sheets;
}

const ReferenceCueSheet *FindReferenceCueSheet(std::span<const ReferenceCueSheet> sheets, std::string_view gameName) {
    auto findFirst = [&](auto &&pred) -> const ReferenceCueSheet * {
        auto it = std::find_if(sheets.begin(), sheets.end(), pred);
        return it != sheets.end() ? &*it : nullptr;
    };

    if (auto *sheet = findFirst([&](const ReferenceCueSheet &s) { return s.name == gameName; })) {
        return sheet;
    }

    const std::string lowerGame = ToLower(gameName);
    if (auto *sheet = findFirst([&](const ReferenceCueSheet &s) { return ToLower(s.name) == lowerGame; })) {
        return sheet;
    }

    auto *sheet = findFirst([&](const ReferenceCueSheet &s) {
        const std::string lowerName = ToLower(s.name);
        return lowerName.find(lowerGame) != std::string::npos || lowerGame.find(lowerName) != std::string::npos;
    });
    if (sheet != nullptr) {
        devlog::info<grp::dumps>("Using \"{}\" as the reference cue sheet of \"{}\"", sheet->name, gameName);
    }
    return sheet;
}

} // namespace cuedat::db
