#pragma once
//
// HeadingClassifier.hpp
// -----------------------------------------------------------------------------
// Decides whether one text line is a heading candidate. Rules are independent
// and evaluated in order; the first one that fires wins (logical OR, no
// scoring). The matching rule is reported for debug logging.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>

#include <boost/regex.hpp>

#include "LayoutTypes.hpp"
#include "Settings.hpp"
#include "StyleProfiler.hpp"
#include "TextUtil.hpp"

namespace pdfoutline {
    enum class HeadingRule {
        None,
        LargerThanBody,
        BoldShort,
        Numbered,
        Keyword,
        ShortAllCaps,
        VerticalGap,
        Override
    };

    [[nodiscard]] inline const char *HeadingRuleName(const HeadingRule rule) noexcept {
        switch (rule) {
            case HeadingRule::LargerThanBody: return "larger-than-body";
            case HeadingRule::BoldShort: return "bold-short";
            case HeadingRule::Numbered: return "numbered";
            case HeadingRule::Keyword: return "keyword";
            case HeadingRule::ShortAllCaps: return "short-all-caps";
            case HeadingRule::VerticalGap: return "vertical-gap";
            case HeadingRule::Override: return "override";
            case HeadingRule::None: break;
        }
        return "none";
    }

    // Everything the classifier looks at for one line.
    struct LineContext {
        std::string text; // stripped line text
        const Span &first;
        BBox bbox;
        std::optional<BBox> previous; // previous non-empty line on the same page
        std::string documentPath;
        int physicalPage = 0;
    };

    namespace detail {
        // "1 Intro", "2.3 Scope", "4.1.2 Details"; "1. Install ..." list items do not match.
        inline const boost::regex &NumberedHeadingPattern() {
            static const boost::regex re(R"(^\d+(\.\d+)*\s+[\S\s]*)");
            return re;
        }

        // Vertical whitespace above a line, in multiples of the body size.
        inline constexpr double kGapFactor = 1.5;

        // Keyword headings tolerate half a point below body size when bold...
        inline constexpr double kKeywordBoldSlack = 0.5;
        // ...or need half a point above body size otherwise.
        inline constexpr double kKeywordSizeBoost = 0.5;

        inline bool IsKeywordHeading(const LineContext &line, const double size, const bool bold,
                                     const double dominant, const Settings &settings) {
            const bool hasKeyword =
                    std::any_of(settings.headingKeywords.begin(), settings.headingKeywords.end(),
                                [&](const std::string &kw) { return text::ContainsIgnoreCase(line.text, kw); });
            if (!hasKeyword)
                return false;

            return (bold && SizeAtLeast(size, dominant - kKeywordBoldSlack)) ||
                   SizeAtLeast(size, dominant + kKeywordSizeBoost) ||
                   (text::EndsWith(line.text, ":") && SizeAtLeast(size, dominant - 1.0));
        }
    } // namespace detail

    inline HeadingRule MatchHeadingRule(const LineContext &line,
                                        const StyleProfile &profile,
                                        const Settings &settings) {
        const HeadingThresholds &th = settings.thresholds;
        const double size = RoundSize(line.first.size);
        const bool bold = line.first.bold;
        const double dominant = profile.dominantFontSize;
        const std::size_t words = text::WordCount(line.text);
        const bool upper = text::IsUpper(line.text);

        // 1. Clearly larger than body text.
        if (SizeExceeds(size, dominant + th.fontSizeDifferenceFromDominant))
            return HeadingRule::LargerThanBody;

        // 2. Bold, not much smaller than body text, and short or shouting.
        if (bold && SizeAtLeast(size, dominant * th.boldFontSizeMinRatioToDominant)) {
            if (words < static_cast<std::size_t>(th.maxWordsForBoldHeading) || upper)
                return HeadingRule::BoldShort;
        }

        // 3. Section numbering.
        if (boost::regex_match(line.text, detail::NumberedHeadingPattern()) &&
            (SizeAtLeast(size, dominant - 1.0) || bold))
            return HeadingRule::Numbered;

        // 4. Heading keywords with some prominence.
        if (detail::IsKeywordHeading(line, size, bold, dominant, settings))
            return HeadingRule::Keyword;

        // 5. Short all-caps line.
        if (upper &&
            words < static_cast<std::size_t>(th.maxWordsForAllCapsHeading) &&
            SizeAtLeast(size, dominant - 1.0))
            return HeadingRule::ShortAllCaps;

        // 6. Preceded by a large vertical gap and not a sentence.
        if (line.previous &&
            line.bbox.y0 - line.previous->y1 > dominant * detail::kGapFactor &&
            SizeAtLeast(size, dominant - 0.5) &&
            !text::EndsWith(line.text, "."))
            return HeadingRule::VerticalGap;

        // 7+. Configured phrase overrides.
        for (const auto &rule: settings.overrides) {
            if (!rule.classifyGate || rule.suppress)
                continue;
            if (!rule.AppliesTo(line.documentPath, line.physicalPage) || !rule.Matches(line.text))
                continue;
            if (rule.classifyGate->Passes(size, bold, words, dominant))
                return HeadingRule::Override;
        }

        return HeadingRule::None;
    }

    [[nodiscard]] inline bool IsLikelyHeading(const LineContext &line,
                                              const StyleProfile &profile,
                                              const Settings &settings) {
        return MatchHeadingRule(line, profile, settings) != HeadingRule::None;
    }

    // A configured suppression rule that removes the line from the outline.
    [[nodiscard]] inline const OverrideRule *FindSuppression(const LineContext &line, const Settings &settings) {
        for (const auto &rule: settings.overrides) {
            if (rule.suppress && rule.AppliesTo(line.documentPath, line.physicalPage) && rule.Matches(line.text))
                return &rule;
        }
        return nullptr;
    }
} // namespace pdfoutline
