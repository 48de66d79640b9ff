#include "settings.hpp"

namespace app {

inline constexpr int kConfigVersion = 1;

// -------------------------------------------------------------------------------------------------
// Parsers

template <typename T>
static void Parse(toml::node_view<toml::node> &node, T &value) {
    if (auto opt = node.value<T>()) {
        value = *opt;
    }
}

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    toml::node_view view{node[name]};
    Parse(view, value);
}

// -------------------------------------------------------------------------------------------------
// Implementation

void Settings::ResetToDefaults() {
    core = {};
    general.hashThreads = 0;
    verify.allowCueMismatch = false;
}

SettingsLoadResult Settings::Load(const std::filesystem::path &path) {
    ResetToDefaults();

    // Use defaults if configuration file does not exist
    if (!std::filesystem::is_regular_file(path)) {
        return SettingsLoadResult::Success();
    }

    auto parseResult = toml::parse_file(path.native());
    if (parseResult.failed()) {
        return SettingsLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    int configVersion = 0;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return SettingsLoadResult::UnsupportedConfigVersion(configVersion);
    }

    if (auto tblGeneral = data["General"]) {
        Parse(tblGeneral, "HashThreads", general.hashThreads);
    }

    if (auto tblCue = data["Cue"]) {
        Parse(tblCue, "DefaultBlocksize", core.cue.defaultBlocksize);
        switch (core.cue.defaultBlocksize) {
        case 2048:
        case 2336:
        case 2352:
        case 2448: break;
        default:
            return SettingsLoadResult::InvalidValue(
                fmt::format("Cue.DefaultBlocksize must be one of 2048, 2336, 2352 or 2448 (got {})",
                            core.cue.defaultBlocksize));
        }
    }

    if (auto tblMatcher = data["Matcher"]) {
        Parse(tblMatcher, "ClosestSizeThreshold", core.matcher.closestSizeThreshold);
        Parse(tblMatcher, "TrackExtension", core.matcher.trackExtension);
        if (core.matcher.trackExtension.empty()) {
            return SettingsLoadResult::InvalidValue("Matcher.TrackExtension cannot be empty");
        }
    }

    if (auto tblVerify = data["Verify"]) {
        Parse(tblVerify, "AllowCueMismatch", verify.allowCueMismatch);
    }

    return SettingsLoadResult::Success();
}

} // namespace app
