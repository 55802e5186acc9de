#pragma once
//
// LevelAssigner.hpp
// -----------------------------------------------------------------------------
// Maps a heading candidate to H1..H4 (or H_UNKNOWN).
//
// Priority:
//   a) section numbering depth   "3." -> H1, "3.1" -> H2, "3.1.2" -> H3 ...
//   b) configured phrase overrides (first matching row wins)
//   c) position of the font size on the document's prominence ladder
// -----------------------------------------------------------------------------

#include <algorithm>
#include <optional>
#include <string>

#include <boost/regex.hpp>

#include "LayoutTypes.hpp"
#include "Settings.hpp"
#include "StyleProfiler.hpp"
#include "TextUtil.hpp"

namespace pdfoutline {
    namespace detail {
        // Leading section number with at least one dot, followed by text.
        inline const boost::regex &SectionNumberPattern() {
            static const boost::regex re(R"(^(\d+(?:\.\d+)*)(\.)?\s+\S)");
            return re;
        }
    } // namespace detail

    // Depth of the leading section number, or nullopt when the text is not
    // numbered. Five or more groups give H_UNKNOWN.
    inline std::optional<Level> LevelFromNumbering(const std::string &text) {
        boost::smatch m;
        if (!boost::regex_search(text, m, detail::SectionNumberPattern()))
            return std::nullopt;

        const std::string number = m[1].str();
        const bool trailingDot = m[2].matched;
        const auto groups = static_cast<int>(std::count(number.begin(), number.end(), '.')) + 1;

        // A bare integer ("2024 Annual Report") is not a section number.
        if (groups == 1 && !trailingDot)
            return std::nullopt;

        return LevelFromDepth(groups);
    }

    inline std::optional<Level> LevelFromOverrides(const Span &first,
                                                   const std::string &text,
                                                   const StyleProfile &profile,
                                                   const Settings &settings,
                                                   const std::string &documentPath,
                                                   const int physicalPage) {
        const double size = RoundSize(first.size);
        const std::size_t words = text::WordCount(text);

        for (const auto &rule: settings.overrides) {
            if (!rule.level || rule.suppress)
                continue;
            if (!rule.AppliesTo(documentPath, physicalPage) || !rule.Matches(text))
                continue;
            if (rule.levelGate && !rule.levelGate->Passes(size, first.bold, words, profile.dominantFontSize))
                continue;
            return rule.level;
        }
        return std::nullopt;
    }

    // Ladder index + 1, capped at H4; H_UNKNOWN when the size is not on it.
    [[nodiscard]] inline Level LevelFromProminence(const double size, const StyleProfile &profile) noexcept {
        const int idx = profile.ProminenceIndex(size);
        if (idx < 0)
            return Level::Unknown;
        return LevelFromDepth(std::min(idx + 1, 4));
    }

    inline Level AssignLevel(const Span &first,
                             const std::string &text,
                             const StyleProfile &profile,
                             const Settings &settings,
                             const std::string &documentPath = {},
                             const int physicalPage = 0) {
        if (const auto numbered = LevelFromNumbering(text))
            return *numbered;

        if (const auto forced = LevelFromOverrides(first, text, profile, settings, documentPath, physicalPage))
            return *forced;

        return LevelFromProminence(RoundSize(first.size), profile);
    }
} // namespace pdfoutline
