#pragma once
//
// LayoutFixtures.hpp
// -----------------------------------------------------------------------------
// Builders for synthetic layout documents, so the heuristics can be tested
// without real PDF files. Every line is placed at x = 72 with a width derived
// from its character count.
// -----------------------------------------------------------------------------

#include <string>
#include <utility>
#include <vector>

#include "LayoutTypes.hpp"
#include "Settings.hpp"
#include "StyleProfiler.hpp"
#include "TextUtil.hpp"

namespace pdfoutline::fixtures {
    inline constexpr double kLeftMargin = 72.0;
    inline constexpr double kPageWidth = 612.0;
    inline constexpr double kPageHeight = 792.0;

    inline Span MakeSpan(const std::string &text, const double size, const bool bold = false,
                         const double x0 = kLeftMargin, const double y0 = 100.0) {
        Span span;
        span.text = text;
        span.size = size;
        span.bold = bold;
        span.font = bold ? "Helvetica-Bold" : "Helvetica";
        const double width = static_cast<double>(text::CharLength(text)) * size * 0.5;
        span.bbox = BBox{x0, y0, x0 + width, y0 + size};
        return span;
    }

    inline Line MakeLine(std::vector<Span> spans) {
        Line line;
        for (std::size_t i = 0; i < spans.size(); ++i) {
            if (i == 0)
                line.bbox = spans[i].bbox;
            else
                line.bbox.Unite(spans[i].bbox);
        }
        line.spans = std::move(spans);
        return line;
    }

    // One-span line whose top edge sits at y.
    inline Line LineAt(const std::string &text, const double size, const bool bold, const double y) {
        return MakeLine({MakeSpan(text, size, bold, kLeftMargin, y)});
    }

    // All lines go into a single block.
    inline Page MakePage(const int index, std::vector<Line> lines) {
        Page page;
        page.index = index;
        page.width = kPageWidth;
        page.height = kPageHeight;
        if (!lines.empty()) {
            Block block;
            block.lines = std::move(lines);
            page.blocks.push_back(std::move(block));
        }
        return page;
    }

    inline Document MakeDocument(const std::string &path, std::vector<Page> pages) {
        Document doc;
        doc.path = path;
        doc.pages = std::move(pages);
        return doc;
    }

    // Body text at `size`, `count` lines stacked 12pt apart from y.
    inline std::vector<Line> BodyLines(const int count, const double y, const double size = 10.0) {
        std::vector<Line> lines;
        for (int i = 0; i < count; ++i) {
            lines.push_back(LineAt("The quarter closed with steady growth in every region.",
                                   size, false, y + 12.0 * i));
        }
        return lines;
    }

    inline Settings TestSettings() {
        Settings settings;
        settings.thresholds.fontSizeDifferenceFromDominant = 2.0;
        settings.thresholds.boldFontSizeMinRatioToDominant = 0.9;
        settings.thresholds.maxWordsForBoldHeading = 12;
        settings.thresholds.maxWordsForAllCapsHeading = 10;
        settings.headingKeywords = {"Overview", "Summary", "Conclusion", "References"};
        settings.noisePatterns = {
            MakeNoisePattern(R"(^Page \d+( of \d+)?$)"),
            MakeNoisePattern(R"(^\d+$)"),
            MakeNoisePattern(R"(Copyright|©)")
        };
        settings.maxHeadingsPerPage = 4;
        return settings;
    }

    inline StyleProfile BodyProfile() {
        StyleProfile profile;
        profile.dominantFontSize = 10.0;
        profile.fontSizesByProminence = {18.0, 14.0, 12.0, 10.0};
        return profile;
    }

    inline OverrideRule MakeOverride(const std::string &name, const std::string &pattern) {
        OverrideRule rule;
        rule.name = name;
        rule.pattern = boost::regex(pattern, boost::regex::perl);
        return rule;
    }
} // namespace pdfoutline::fixtures
