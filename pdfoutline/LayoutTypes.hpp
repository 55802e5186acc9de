#pragma once
//
// LayoutTypes.hpp
// -----------------------------------------------------------------------------
// Plain layout model handed over by the PDF decoder (spans / lines / blocks /
// pages) plus the outline records produced by the heuristic core.
//
// Coordinates are top-down: y0 is the top edge, y1 the bottom edge.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdfoutline {
    // Tolerance for font-size comparisons (sizes carry one decimal).
    inline constexpr double kSizeEpsilon = 1e-6;

    [[nodiscard]] inline double RoundSize(const double size) noexcept {
        return std::round(size * 10.0) / 10.0;
    }

    // Integer key for a rounded size, safe to use in maps.
    [[nodiscard]] inline long SizeKey(const double size) noexcept {
        return std::lround(size * 10.0);
    }

    [[nodiscard]] inline bool SizeAtLeast(const double size, const double bound) noexcept {
        return size >= bound - kSizeEpsilon;
    }

    [[nodiscard]] inline bool SizeExceeds(const double size, const double bound) noexcept {
        return size > bound + kSizeEpsilon;
    }

    struct BBox {
        double x0 = 0.0;
        double y0 = 0.0;
        double x1 = 0.0;
        double y1 = 0.0;

        [[nodiscard]] double Width() const noexcept { return x1 - x0; }
        [[nodiscard]] double Height() const noexcept { return y1 - y0; }

        void Unite(const BBox &other) noexcept {
            x0 = std::min(x0, other.x0);
            y0 = std::min(y0, other.y0);
            x1 = std::max(x1, other.x1);
            y1 = std::max(y1, other.y1);
        }
    };

    struct Span {
        std::string text;
        double size = 0.0; // rounded to one decimal
        bool bold = false;
        bool italic = false;
        BBox bbox;
        std::string font;
    };

    struct Line {
        std::vector<Span> spans;
        BBox bbox;

        // Concatenated span text, not trimmed.
        [[nodiscard]] std::string RawText() const {
            std::string out;
            for (const auto &span: spans)
                out += span.text;
            return out;
        }
    };

    struct Block {
        std::vector<Line> lines;
    };

    struct Page {
        int index = 0; // 0-based physical index
        double width = 0.0;
        double height = 0.0;
        std::vector<Block> blocks;
    };

    struct Document {
        std::string path;
        std::vector<Page> pages;
    };

    // ------------------------- Outline records -------------------------

    enum class Level {
        H1 = 1,
        H2,
        H3,
        H4,
        Unknown
    };

    [[nodiscard]] inline const char *LevelName(const Level level) noexcept {
        switch (level) {
            case Level::H1: return "H1";
            case Level::H2: return "H2";
            case Level::H3: return "H3";
            case Level::H4: return "H4";
            case Level::Unknown: break;
        }
        return "H_UNKNOWN";
    }

    [[nodiscard]] inline std::optional<Level> ParseLevel(const std::string_view name) noexcept {
        if (name == "H1") return Level::H1;
        if (name == "H2") return Level::H2;
        if (name == "H3") return Level::H3;
        if (name == "H4") return Level::H4;
        if (name == "H_UNKNOWN") return Level::Unknown;
        return std::nullopt;
    }

    // H1 = 1 (most severe) ... H_UNKNOWN = 5
    [[nodiscard]] inline int Severity(const Level level) noexcept {
        return static_cast<int>(level);
    }

    // 1 -> H1 ... 4 -> H4, anything else -> H_UNKNOWN
    [[nodiscard]] inline Level LevelFromDepth(const int depth) noexcept {
        if (depth < 1 || depth > 4)
            return Level::Unknown;
        return static_cast<Level>(depth);
    }

    struct OutlineEntry {
        Level level = Level::Unknown;
        std::string text;
        int page = 0; // logical, 1-based

        bool operator==(const OutlineEntry &other) const {
            return level == other.level && text == other.text && page == other.page;
        }
    };

    // An entry plus its vertical position, used only while ordering one page.
    struct HeadingCandidate {
        OutlineEntry entry;
        double y = 0.0;
    };

    struct Outline {
        std::string title;
        std::vector<OutlineEntry> entries;
        std::optional<std::string> error;
    };
} // namespace pdfoutline
