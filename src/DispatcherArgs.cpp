#include "DispatcherArgs.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <hyprutils/string/ConstVarList.hpp>
#include <string_view>

using namespace Hyprutils::String;

static std::optional<int> parseInt(std::string_view value) {
    int result = 0;
    if (value.empty())
        return std::nullopt;

    // from_chars doesn't take a leading '+'
    if (value.front() == '+')
        value.remove_prefix(1);

    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size())
        return std::nullopt;

    return result;
}

static std::optional<EAnchor> parseAnchor(std::string_view value) {
    if (value == "start")
        return EAnchor::START;
    if (value == "end")
        return EAnchor::END;
    if (value == "fill")
        return EAnchor::FILL;
    return std::nullopt;
}

// "fill" maps to MATCH_CONTAINER when allowFill is set
static std::optional<int> parseLength(std::string_view value, bool allowFill) {
    if (allowFill && value == "fill")
        return MATCH_CONTAINER;

    const auto LENGTH = parseInt(value);
    if (!LENGTH || *LENGTH < 0)
        return std::nullopt;
    return LENGTH;
}

static std::optional<FrameRect> parseRect(std::string_view value) {
    const CConstVarList PARTS(std::string{value}, 0, ',');
    if (PARTS.size() != 4)
        return std::nullopt;

    const auto L = parseInt(PARTS[0]);
    const auto T = parseInt(PARTS[1]);
    const auto R = parseInt(PARTS[2]);
    const auto B = parseInt(PARTS[3]);
    if (!L || !T || !R || !B)
        return std::nullopt;

    FrameRect rect = {*L, *T, *R, *B};
    if (!rect.wellFormed())
        return std::nullopt;
    return rect;
}

DispatcherArgs parseDispatcherArgs(const std::string& arg) {
    DispatcherArgs result;

    // Convert to lowercase for case-insensitive comparison
    std::string lowerArg = arg;
    std::transform(lowerArg.begin(), lowerArg.end(), lowerArg.begin(), [](unsigned char c) { return std::tolower(c); });

    std::optional<FrameRect> insetBounds;

    const CConstVarList      TOKENS(lowerArg, 0, ' ', true);
    for (size_t i = 0; i < TOKENS.size(); ++i) {
        const std::string_view TOKEN = TOKENS[i];
        const std::string      token{TOKEN};
        const size_t           COLON = TOKEN.find(':');
        const std::string_view KEY   = TOKEN.substr(0, COLON);
        const std::string_view VALUE = COLON == std::string_view::npos ? std::string_view{} : TOKEN.substr(COLON + 1);

        if (COLON == std::string_view::npos) {
            if (KEY == "debug")
                result.action = DispatcherArgs::Action::DEBUG;
            else if (KEY == "place")
                result.action = DispatcherArgs::Action::PLACE;
            else if (KEY == "scaled")
                result.attrs.scaledSurface = true;
            else {
                result.error = "Unknown argument: " + token;
                return result;
            }
            continue;
        }

        if (KEY == "anchor") {
            const CConstVarList PARTS(std::string{VALUE}, 0, ',');
            const auto H     = PARTS.size() == 2 ? parseAnchor(PARTS[0]) : std::nullopt;
            const auto V     = PARTS.size() == 2 ? parseAnchor(PARTS[1]) : std::nullopt;
            if (!H || !V) {
                result.error = "Invalid anchor: " + std::string{VALUE} + ". Expected <start|end|fill>,<start|end|fill>";
                return result;
            }
            result.attrs.horizontal = *H;
            result.attrs.vertical   = *V;
        } else if (KEY == "offset") {
            const CConstVarList PARTS(std::string{VALUE}, 0, ',');
            const auto X     = PARTS.size() == 2 ? parseInt(PARTS[0]) : std::nullopt;
            const auto Y     = PARTS.size() == 2 ? parseInt(PARTS[1]) : std::nullopt;
            if (!X || !Y) {
                result.error = "Invalid offset: " + std::string{VALUE} + ". Expected <x>,<y>";
                return result;
            }
            result.attrs.x = *X;
            result.attrs.y = *Y;
        } else if (KEY == "size") {
            const CConstVarList PARTS(std::string{VALUE}, 0, 'x');
            const auto W     = PARTS.size() == 2 ? parseLength(PARTS[0], false) : std::nullopt;
            const auto H     = PARTS.size() == 2 ? parseLength(PARTS[1], false) : std::nullopt;
            if (!W || !H) {
                result.error = "Invalid size: " + std::string{VALUE} + ". Expected <w>x<h>";
                return result;
            }
            result.measured = MeasuredSize{*W, *H};
        } else if (KEY == "declared") {
            const CConstVarList PARTS(std::string{VALUE}, 0, 'x');
            const auto W     = PARTS.size() == 2 ? parseLength(PARTS[0], true) : std::nullopt;
            const auto H     = PARTS.size() == 2 ? parseLength(PARTS[1], true) : std::nullopt;
            if (!W || !H) {
                result.error = "Invalid declared size: " + std::string{VALUE} + ". Expected <w|fill>x<h|fill>";
                return result;
            }
            result.attrs.width  = *W;
            result.attrs.height = *H;
        } else if (KEY == "container" || KEY == "inset") {
            const auto RECT = parseRect(VALUE);
            if (!RECT) {
                result.error = "Invalid " + std::string{KEY} + " bounds: " + std::string{VALUE} + ". Expected <left>,<top>,<right>,<bottom>";
                return result;
            }
            if (KEY == "container")
                result.container = ContainerBounds{.bounds = *RECT, .fullscreen = false, .tempInsetBounds = {}};
            else
                insetBounds = RECT;
        } else {
            result.error = "Unknown argument: " + token;
            return result;
        }
    }

    if (insetBounds) {
        if (!result.container) {
            result.error = "inset: needs a container: to apply to";
            return result;
        }
        result.container->tempInsetBounds = *insetBounds;
    }

    return result;
}
