#ifndef KINDLE_UTILS_TERMINAL_HPP
#define KINDLE_UTILS_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Kindle::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kGreen = "\033[32m";

        inline constexpr std::string_view kAzure  = "\033[38;5;33m";
        inline constexpr std::string_view kOrange = "\033[38;5;208m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck = "✔";
        inline constexpr std::string_view kInfo  = "ℹ";
        inline constexpr std::string_view kWarn  = "⚠";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Glyph followed by a space, colored only when asked to.
    inline std::string Prefix(std::string_view glyph, std::string_view color, bool colored) {
        std::string out = colored ? ApplyColor(glyph, color) : std::string(glyph);
        out.push_back(' ');
        return out;
    }
}

#endif // KINDLE_UTILS_TERMINAL_HPP
