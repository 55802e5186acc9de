#pragma once
//
// StyleProfiler.hpp
// -----------------------------------------------------------------------------
// Document-wide font statistics: the dominant (body text) size and the
// prominence ladder used as the fallback heading-level scale.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <map>
#include <vector>

#include "LayoutTypes.hpp"

namespace pdfoutline {
    // Sizes at or below this are footnotes / page numbers, not body text.
    inline constexpr double kTinyFontSize = 6.0;

    struct StyleProfile {
        double dominantFontSize = 0.0;
        // Unique sizes, most prominent first.
        std::vector<double> fontSizesByProminence;

        // 0-based ladder position of a size, or -1.
        [[nodiscard]] int ProminenceIndex(const double size) const noexcept {
            const long key = SizeKey(size);
            for (std::size_t i = 0; i < fontSizesByProminence.size(); ++i) {
                if (SizeKey(fontSizesByProminence[i]) == key)
                    return static_cast<int>(i);
            }
            return -1;
        }
    };

    namespace detail {
        struct SizeStats {
            double size = 0.0;
            int count = 0;
            int boldCount = 0;
        };

        // Most frequent entry; ties go to the size seen first.
        inline const SizeStats *MostFrequent(const std::vector<SizeStats> &stats, const bool skipTiny) {
            const SizeStats *best = nullptr;
            for (const auto &s: stats) {
                if (skipTiny && !SizeExceeds(s.size, kTinyFontSize))
                    continue;
                if (!best || s.count > best->count)
                    best = &s;
            }
            return best;
        }
    } // namespace detail

    inline StyleProfile ProfileDocument(const Document &doc) {
        // Kept in first-seen order so that frequency ties are deterministic.
        std::vector<detail::SizeStats> stats;
        std::map<long, std::size_t> slot;

        for (const auto &page: doc.pages) {
            for (const auto &block: page.blocks) {
                for (const auto &line: block.lines) {
                    for (const auto &span: line.spans) {
                        const double size = RoundSize(span.size);
                        auto [it, inserted] = slot.try_emplace(SizeKey(size), stats.size());
                        if (inserted)
                            stats.push_back({size, 0, 0});

                        auto &entry = stats[it->second];
                        ++entry.count;
                        if (span.bold)
                            ++entry.boldCount;
                    }
                }
            }
        }

        StyleProfile profile;
        if (stats.empty())
            return profile;

        const detail::SizeStats *dominant = detail::MostFrequent(stats, /*skipTiny=*/true);
        if (!dominant)
            dominant = detail::MostFrequent(stats, /*skipTiny=*/false);
        profile.dominantFontSize = dominant->size;

        std::vector<detail::SizeStats> ladder = stats;
        std::stable_sort(ladder.begin(), ladder.end(),
                         [](const detail::SizeStats &a, const detail::SizeStats &b) {
                             if (SizeKey(a.size) != SizeKey(b.size))
                                 return a.size > b.size;
                             return a.boldCount > b.boldCount;
                         });

        profile.fontSizesByProminence.reserve(ladder.size());
        for (const auto &s: ladder)
            profile.fontSizesByProminence.push_back(s.size);

        return profile;
    }
} // namespace pdfoutline
