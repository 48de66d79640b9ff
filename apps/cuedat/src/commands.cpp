#include "commands.hpp"

#include "candidate_hasher.hpp"

#include <cuedat/cuedat.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <span>

using namespace cuedat;
using media::cue::CueResult;

namespace app {

// -------------------------------------------------------------------------------------------------
// Helpers

static bool ReadTextFile(const std::filesystem::path &path, std::string &text, std::error_code &error) {
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        error.assign(errno, std::generic_category());
        return false;
    }
    text.assign(std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{});
    if (in.bad()) {
        error = std::make_error_code(std::errc::io_error);
        return false;
    }
    error.clear();
    return true;
}

static bool WriteTextFile(const std::filesystem::path &path, std::string_view text, std::error_code &error) {
    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    if (!out) {
        error.assign(errno, std::generic_category());
        return false;
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
        error = std::make_error_code(std::errc::io_error);
        return false;
    }
    error.clear();
    return true;
}

static media::cue::ParseOptions MakeParseOptions(const std::filesystem::path &cuePath, const Settings &settings) {
    media::cue::ParseOptions parseOptions{};
    parseOptions.basePath = cuePath.parent_path().generic_string();
    parseOptions.blocksize = settings.core.cue.defaultBlocksize;
    parseOptions.sizeProvider = [](const std::string &path) -> uintmax_t {
        std::error_code error{};
        const uintmax_t size = std::filesystem::file_size(path, error);
        return error ? 0 : size;
    };
    return parseOptions;
}

static CueResult PrepareOutputDir(const std::filesystem::path &outputDir) {
    std::error_code error{};
    std::filesystem::create_directories(outputDir, error);
    if (error) {
        return CueResult::IOError(fmt::format("Could not create output directory \"{}\"", outputDir), error);
    }
    return CueResult::Success();
}

// Writes the cue sheet and, unless only the cue sheet was requested, every output file.
static CueResult WriteResults(const CommandOptions &options, std::string_view basename, std::string_view cueText,
                              std::span<const media::cue::OutputFile> outputs) {
    if (auto result = PrepareOutputDir(options.outputDir); !result) {
        return result;
    }

    const std::filesystem::path cuePath = options.outputDir / fmt::format("{}.cue", basename);
    std::error_code error{};
    if (!WriteTextFile(cuePath, cueText, error)) {
        return CueResult::IOError(fmt::format("Could not write \"{}\"", cuePath), error);
    }
    fmt::println("  wrote {}", cuePath);

    if (options.cueOnly) {
        return CueResult::Success();
    }
    for (const media::cue::OutputFile &output : outputs) {
        if (auto result = media::WriteOutputFile(output, options.outputDir); !result) {
            return result;
        }
        fmt::println("  wrote {}", options.outputDir / output.name);
    }
    return CueResult::Success();
}

static bool LoadCatalogue(const CommandOptions &options, db::Catalogue &catalogue) {
    if (options.datPath.empty()) {
        fmt::println("Missing argument: --dat");
        return false;
    }
    if (auto result = db::LoadDat(options.datPath, catalogue); !result) {
        fmt::println("Could not load {}: {}", options.datPath, result.string());
        return false;
    }
    fmt::println("Loaded {} games for {}", catalogue.GameCount(), catalogue.systemName);
    return true;
}

// Hashes the files of a dump and turns them into matcher candidates.
// Files that cannot be hashed are reported and left out.
static std::vector<db::CandidateFile> HashCandidates(std::span<const std::filesystem::path> files,
                                                     const Settings &settings) {
    std::vector<db::CandidateFile> candidates{};
    for (HashedFile &hashed : HashFiles(files, settings.general.hashThreads)) {
        if (hashed.error) {
            fmt::println("  could not hash {}: {}", hashed.path, hashed.error.message());
            continue;
        }
        candidates.push_back({
            .path = hashed.path.filename().string(),
            .size = hashed.digest.size,
            .sha1 = std::move(hashed.digest.sha1),
            .crc32 = hashed.digest.crc32,
        });
    }
    return candidates;
}

// -------------------------------------------------------------------------------------------------
// Commands

int RunMerge(const CommandOptions &options, const Settings &settings) {
    size_t failures = 0;
    for (const std::filesystem::path cuePath : options.inputs) {
        fmt::println("Merging {}", cuePath);
        const std::string basename = options.basename.empty() ? cuePath.stem().string() : options.basename;

        std::string cueText{};
        std::error_code error{};
        if (!ReadTextFile(cuePath, cueText, error)) {
            fmt::println("  {}", CueResult::IOError("Could not read cue sheet", error).string());
            failures++;
            continue;
        }

        media::cue::MergeResult merged{};
        CueResult result = media::cue::Merge(cueText, basename, MakeParseOptions(cuePath, settings), merged);
        if (result) {
            result = WriteResults(options, basename, merged.cueText, std::span{&merged.output, 1});
        }
        if (!result) {
            fmt::println("  {}", result.string());
            failures++;
            continue;
        }
        fmt::println("  merged {} file(s), {} sectors of {} bytes", merged.files.size(), merged.layout.totalSectors,
                     merged.blocksize);
    }
    return failures == 0 ? 0 : 1;
}

int RunSplit(const CommandOptions &options, const Settings &settings) {
    size_t failures = 0;
    for (const std::filesystem::path cuePath : options.inputs) {
        fmt::println("Splitting {}", cuePath);
        const std::string basename = options.basename.empty() ? cuePath.stem().string() : options.basename;

        std::string cueText{};
        std::error_code error{};
        if (!ReadTextFile(cuePath, cueText, error)) {
            fmt::println("  {}", CueResult::IOError("Could not read cue sheet", error).string());
            failures++;
            continue;
        }

        media::cue::SplitResult split{};
        CueResult result = media::cue::Split(cueText, basename, MakeParseOptions(cuePath, settings), split);
        if (result) {
            result = WriteResults(options, basename, split.cueText, split.outputs);
        }
        if (!result) {
            fmt::println("  {}", result.string());
            failures++;
            continue;
        }
        fmt::println("  split into {} track(s) of {}-byte sectors", split.outputs.size(), split.blocksize);
    }
    return failures == 0 ? 0 : 1;
}

int RunIdentify(const CommandOptions &options, const Settings &settings) {
    db::Catalogue catalogue{};
    if (!LoadCatalogue(options, catalogue)) {
        return 1;
    }

    size_t matches = 0;
    size_t partials = 0;
    size_t nones = 0;
    size_t failures = 0;
    for (const std::filesystem::path input : options.inputs) {
        fmt::println("Identifying {}", input);

        std::error_code error{};
        const auto files = db::ListDumpFiles(input, error);
        if (error) {
            fmt::println("  could not list files: {}", error.message());
            failures++;
            continue;
        }

        // All hashes must be in before matching
        const auto candidates = HashCandidates(files, settings);
        const auto verdict = db::Identify(candidates, catalogue, settings.core.matcher);
        if (!verdict) {
            fmt::println("  no files to identify");
            failures++;
            continue;
        }

        switch (verdict->status) {
        case db::MatchStatus::Match: matches++; break;
        case db::MatchStatus::Partial: partials++; break;
        case db::MatchStatus::None: nones++; break;
        }
        if (verdict->game != nullptr) {
            fmt::println("  {}: \"{}\" ({})", db::ToString(verdict->status), verdict->game->name, verdict->reason);
        } else {
            fmt::println("  {}: {}", db::ToString(verdict->status), verdict->reason);
        }
        if (verdict->candidates.size() > 1) {
            for (const db::Game *game : verdict->candidates) {
                fmt::println("    candidate: \"{}\"", game->name);
            }
        }
    }

    fmt::println("{} match, {} partial, {} none, {} failed", matches, partials, nones, failures);
    return failures == 0 ? 0 : 1;
}

int RunVerify(const CommandOptions &options, const Settings &settings) {
    db::Catalogue catalogue{};
    if (!LoadCatalogue(options, catalogue)) {
        return 1;
    }

    db::VerifyOptions verifyOptions{};
    verifyOptions.allowCueMismatch = settings.verify.allowCueMismatch;
    verifyOptions.trackExtension = settings.core.matcher.trackExtension;
    if (options.referenceCue) {
        std::string referenceText{};
        std::error_code error{};
        if (!ReadTextFile(*options.referenceCue, referenceText, error)) {
            fmt::println("Could not read reference cue sheet {}: {}", *options.referenceCue, error.message());
            return 1;
        }
        verifyOptions.referenceCue = std::move(referenceText);
    }

    std::vector<db::ReferenceCueSheet> referenceSheets{};
    if (options.cueSheetsDir) {
        std::error_code error{};
        referenceSheets = db::ListReferenceCueSheets(*options.cueSheetsDir, error);
        if (error) {
            fmt::println("Could not list cue sheets in {}: {}", *options.cueSheetsDir, error.message());
            return 1;
        }
        if (referenceSheets.empty()) {
            fmt::println("No cue sheets found in {}", *options.cueSheetsDir);
            return 1;
        }
        fmt::println("Found {} reference cue sheets", referenceSheets.size());

        verifyOptions.referenceCueProvider = [&](const db::Game &game) -> std::optional<std::string> {
            const db::ReferenceCueSheet *sheet = db::FindReferenceCueSheet(referenceSheets, game.name);
            if (sheet == nullptr) {
                fmt::println("  no reference cue sheet for \"{}\"", game.name);
                return std::nullopt;
            }
            std::string text{};
            std::error_code readError{};
            if (!ReadTextFile(sheet->path, text, readError)) {
                fmt::println("  could not read reference cue sheet {}: {}", sheet->path, readError.message());
                return std::nullopt;
            }
            return text;
        };
    }

    size_t verified = 0;
    size_t failures = 0;
    for (const std::filesystem::path input : options.inputs) {
        fmt::println("Verifying {}", input);

        std::error_code error{};
        const auto files = db::ListDumpFiles(input, error);
        if (error) {
            fmt::println("  could not list files: {}", error.message());
            failures++;
            continue;
        }

        std::optional<db::DumpCueSheet> cueSheet{};
        auto cueIt = std::find_if(files.begin(), files.end(), [](const std::filesystem::path &file) {
            return db::HasExtension(file.filename().string(), ".cue");
        });
        if (cueIt != files.end()) {
            db::DumpCueSheet sheet{.name = cueIt->filename().string()};
            if (!ReadTextFile(*cueIt, sheet.text, error)) {
                fmt::println("  could not read {}: {}", *cueIt, error.message());
                failures++;
                continue;
            }
            cueSheet = std::move(sheet);
        }

        const auto candidates = HashCandidates(files, settings);
        const db::DumpVerification result = db::VerifyDump(candidates, cueSheet, catalogue, verifyOptions);
        for (const std::string &problem : result.problems) {
            fmt::println("  {}", problem);
        }
        if (result.game != nullptr) {
            fmt::println("  \"{}\": {}", result.game->name, db::ToString(result.cue));
        }
        if (result.verified) {
            fmt::println("  verified correct and complete");
            verified++;
        } else {
            fmt::println("  verification failed");
            failures++;
        }
    }

    fmt::println("{} verified, {} failed", verified, failures);
    return failures == 0 ? 0 : 1;
}

} // namespace app
