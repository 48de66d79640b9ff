#include <cuedat/media/cue/cue_line.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace cuedat::media::cue {

static bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static std::string_view Trim(std::string_view text) {
    while (!text.empty() && IsSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && IsSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

// Splits off the next whitespace-delimited token from text.
static std::string_view NextToken(std::string_view &text) {
    text = Trim(text);
    const size_t end = static_cast<size_t>(std::find_if(text.begin(), text.end(), IsSpace) - text.begin());
    const std::string_view token = text.substr(0, end);
    text.remove_prefix(end);
    return token;
}

static bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
    });
}

static std::optional<uint32> ParseNumber(std::string_view token) {
    if (token.empty()) {
        return std::nullopt;
    }
    uint32 value{};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

static CueLine ClassifyFile(std::string_view args) {
    args = Trim(args);
    std::string_view name{};
    std::string_view format{};
    if (args.starts_with('"')) {
        // FILE "name with spaces.bin" BINARY
        const size_t closing = args.find('"', 1);
        if (closing == std::string_view::npos) {
            return line::Ignored{};
        }
        name = args.substr(1, closing - 1);
        format = Trim(args.substr(closing + 1));
    } else {
        // FILE name.bin BINARY -- the type is the last token, everything before it is the name
        const auto it = std::find_if(args.rbegin(), args.rend(), IsSpace);
        if (it == args.rend()) {
            return line::Ignored{};
        }
        const size_t split = static_cast<size_t>(std::distance(it, args.rend())) - 1;
        name = Trim(args.substr(0, split));
        format = Trim(args.substr(split + 1));
    }

    if (name.empty() || format.empty() || std::any_of(format.begin(), format.end(), IsSpace)) {
        return line::Ignored{};
    }
    return line::File{.name = std::string{name}, .format = std::string{format}};
}

CueLine ClassifyLine(std::string_view text) {
    std::string_view rest = Trim(text);
    const std::string_view keyword = NextToken(rest);

    if (EqualsIgnoreCase(keyword, "FILE")) {
        return ClassifyFile(rest);
    }

    if (EqualsIgnoreCase(keyword, "TRACK")) {
        // TRACK [number] [datatype]
        const auto number = ParseNumber(NextToken(rest));
        const std::string_view type = NextToken(rest);
        if (!number || type.empty()) {
            return line::Ignored{};
        }
        return line::Track{.number = *number, .trackType = std::string{type}};
    }

    if (EqualsIgnoreCase(keyword, "INDEX")) {
        // INDEX [number] [mm:ss:ff]
        const auto id = ParseNumber(NextToken(rest));
        const std::string_view stamp = NextToken(rest);
        if (!id || stamp.empty()) {
            return line::Ignored{};
        }
        return line::Index{.id = *id, .stamp = std::string{stamp}};
    }

    if (EqualsIgnoreCase(keyword, "PREGAP") || EqualsIgnoreCase(keyword, "POSTGAP")) {
        const std::string_view stamp = NextToken(rest);
        if (stamp.empty()) {
            return line::Ignored{};
        }
        if (EqualsIgnoreCase(keyword, "PREGAP")) {
            return line::Pregap{.stamp = std::string{stamp}};
        }
        return line::Postgap{.stamp = std::string{stamp}};
    }

    return line::Ignored{};
}

} // namespace cuedat::media::cue
