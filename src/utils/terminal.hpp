#ifndef PTAH_TERMINAL_HPP
#define PTAH_TERMINAL_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Ptah::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";

        inline constexpr std::string_view kCrimson      = "\033[38;5;196m";
        inline constexpr std::string_view kGoldenrod    = "\033[38;5;221m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck     = "✔";
        inline constexpr std::string_view kCross     = "✘";

        // Heavy box drawing
        inline constexpr std::string_view kBoxTopLeft         = "┏";
        inline constexpr std::string_view kBoxTopSeparator    = "┳";
        inline constexpr std::string_view kBoxTopRight        = "┓";
        inline constexpr std::string_view kBoxMiddleLeft      = "┣";
        inline constexpr std::string_view kBoxMiddleSeparator = "╋";
        inline constexpr std::string_view kBoxMiddleRight     = "┫";
        inline constexpr std::string_view kBoxBottomLeft      = "┗";
        inline constexpr std::string_view kBoxBottomSeparator = "┻";
        inline constexpr std::string_view kBoxBottomRight     = "┛";
        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kBoxVertical        = "┃";
    }

    // ---------- Small helpers ----------
    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }

    // An empty color leaves the text untouched (plain output for pipes and files).
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        if (color.empty()) return std::string(s);
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Left-aligned cell of exactly `width` columns; longer text is cut.
    inline std::string Pad(std::string_view text, std::size_t width) {
        std::string out(text.substr(0, width));
        out.append(width - out.size(), ' ');
        return out;
    }

    // ---------- Separators ----------
    enum class HSepKind { Top, Middle, Bottom };

    // spacings = widths of each segment between vertical junctions.
    inline std::string HSeparator(const std::vector<std::size_t>& spacings,
                                  std::string_view color,
                                  HSepKind kind) {
        using namespace Symbols;

        std::string_view left;
        std::string_view midJunction;
        std::string_view right;
        switch (kind) {
            case HSepKind::Top:
                left = kBoxTopLeft; midJunction = kBoxTopSeparator; right = kBoxTopRight;
                break;
            case HSepKind::Middle:
                left = kBoxMiddleLeft; midJunction = kBoxMiddleSeparator; right = kBoxMiddleRight;
                break;
            case HSepKind::Bottom:
                left = kBoxBottomLeft; midJunction = kBoxBottomSeparator; right = kBoxBottomRight;
                break;
        }

        std::string out;
        out.reserve(16 + spacings.size() * 8);
        out.append(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(midJunction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    inline std::string HTop(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, HSepKind::Top);
    }
    inline std::string HMid(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, HSepKind::Middle);
    }
    inline std::string HBottom(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, HSepKind::Bottom);
    }

    // ┃ a ┃ b ┃ with each cell padded to its spacing (one blank column on the left).
    inline std::string Row(const std::vector<std::string>& cells,
                           const std::vector<std::size_t>& spacings,
                           std::string_view frame_color) {
        const auto bar = ApplyColor(Symbols::kBoxVertical, frame_color);
        std::string out = bar;
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            const std::string_view cell = i < cells.size() ? std::string_view(cells[i]) : std::string_view{};
            out.append(" ").append(Pad(cell, spacings[i] > 0 ? spacings[i] - 1 : 0)).append(bar);
        }
        return out;
    }
}

#endif // PTAH_TERMINAL_HPP
