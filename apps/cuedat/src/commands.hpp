#pragma once

#include "settings.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace app {

struct CommandOptions {
    std::vector<std::string> inputs;   // cue sheets (merge/split) or dump folders/files (identify/verify)
    std::filesystem::path outputDir;   // where merge/split write their results
    std::string basename;              // output name without extension; defaults to the input cue sheet's name
    bool cueOnly = false;              // merge/split: write the cue sheet but not the track data
    std::filesystem::path datPath;     // identify/verify: the catalogue
    std::optional<std::filesystem::path> referenceCue; // verify: original cue sheet to compare geometry with
    std::optional<std::filesystem::path> cueSheetsDir; // verify: original cue sheets, picked by game name
};

// Each command processes every input independently. Failures are reported and the batch carries on.
// The return value is the process exit code: 0 if every input succeeded, 1 otherwise.

int RunMerge(const CommandOptions &options, const Settings &settings);
int RunSplit(const CommandOptions &options, const Settings &settings);
int RunIdentify(const CommandOptions &options, const Settings &settings);
int RunVerify(const CommandOptions &options, const Settings &settings);

} // namespace app
