#pragma once
//
// PageCurator.hpp
// -----------------------------------------------------------------------------
// Turns one page's candidates into outline entries: order by (level, y), keep
// at most `maxHeadingsPerPage`, and fall back to the topmost prominent span
// when nothing qualified.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "ExtractionContext.hpp"
#include "LayoutTypes.hpp"
#include "TextUtil.hpp"

namespace pdfoutline {
    // Topmost prominent span on the page that is not noise or the title.
    inline std::optional<std::string> FindFallbackHeading(const Page &page, const ExtractionContext &ctx) {
        const double dominant = ctx.profile.dominantFontSize;
        std::optional<std::string> best;
        double bestY = 0.0;

        for (const auto &block: page.blocks) {
            for (const auto &line: block.lines) {
                for (const auto &span: line.spans) {
                    std::string t = text::Strip(span.text);
                    if (t.empty())
                        continue;
                    if (ctx.settings.IsNoise(t) || (!ctx.title.empty() && t == ctx.title))
                        continue;

                    const bool prominent = SizeAtLeast(span.size, dominant - 0.5) || span.bold;
                    const bool wordy = text::WordCount(t) > 1 ||
                                       (text::CharLength(t) > 3 && !text::IsAllDigits(t));
                    if (!prominent || !wordy)
                        continue;

                    if (!best || line.bbox.y0 < bestY) {
                        best = std::move(t);
                        bestY = line.bbox.y0;
                    }
                }
            }
        }

        return best;
    }

    inline std::vector<OutlineEntry> CuratePage(std::vector<HeadingCandidate> candidates,
                                                const Page &page,
                                                const int logicalPage,
                                                ExtractionContext &ctx) {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const HeadingCandidate &a, const HeadingCandidate &b) {
                             if (Severity(a.entry.level) != Severity(b.entry.level))
                                 return Severity(a.entry.level) < Severity(b.entry.level);
                             return a.y < b.y;
                         });

        const auto cap = static_cast<std::size_t>(std::max(ctx.settings.maxHeadingsPerPage, 0));
        if (candidates.size() > cap)
            candidates.resize(cap);

        std::vector<OutlineEntry> entries;
        entries.reserve(candidates.size());
        for (auto &c: candidates)
            entries.push_back(std::move(c.entry));

        if (entries.empty()) {
            if (auto text = FindFallbackHeading(page, ctx)) {
                OutlineEntry fallback{Level::H1, std::move(*text), logicalPage};
                if (ctx.MarkEmitted(fallback))
                    entries.push_back(std::move(fallback));
            }
        }

        return entries;
    }
} // namespace pdfoutline
