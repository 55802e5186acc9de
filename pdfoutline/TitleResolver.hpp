#pragma once
//
// TitleResolver.hpp
// -----------------------------------------------------------------------------
// Reconstructs the document title from the first physical page.
//
//   1. Configured fragments: every fragment must appear in some line of the
//      upper half of the page; the matching lines are joined in fragment order.
//   2. Otherwise: all spans at the page's largest font size, de-duplicated and
//      joined longest first. Rejected when too short or when it is header /
//      footer noise.
//   3. Banner phrases clear the result (decorative flyer text is not a title).
// -----------------------------------------------------------------------------

#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "LayoutTypes.hpp"
#include "Settings.hpp"
#include "TextUtil.hpp"

namespace pdfoutline {
    namespace detail {
        // A span counts as a duplicate when an already-joined span covers at
        // least this share of its width.
        inline constexpr double kOverprintCoverage = 0.5;

        [[nodiscard]] inline double HorizontalOverlap(const BBox &a, const BBox &b) noexcept {
            return std::max(0.0, std::min(a.x1, b.x1) - std::max(a.x0, b.x0));
        }

        // Joins a line's spans, dropping overprinted / shadow copies.
        inline std::string JoinDistinctSpans(const Line &line) {
            std::vector<BBox> placed;
            std::string out;

            for (const auto &span: line.spans) {
                const double width = span.bbox.Width();
                const bool duplicate =
                        width > 0.0 &&
                        std::any_of(placed.begin(), placed.end(), [&](const BBox &b) {
                            return HorizontalOverlap(span.bbox, b) >= width * kOverprintCoverage;
                        });
                if (duplicate)
                    continue;

                out += span.text;
                placed.push_back(span.bbox);
            }

            return out;
        }

        inline std::string TitleFromFragments(const Page &page, const TitleRules &rules) {
            if (rules.fragments.empty())
                return {};

            std::vector<std::string> found(rules.fragments.size());
            const double upperHalf = page.height / 2.0;

            for (const auto &block: page.blocks) {
                for (const auto &line: block.lines) {
                    if (line.bbox.y0 >= upperHalf)
                        continue;

                    const std::string text = text::Strip(JoinDistinctSpans(line));
                    for (std::size_t i = 0; i < rules.fragments.size(); ++i) {
                        if (text::Contains(text, rules.fragments[i])) {
                            found[i] = text;
                            break;
                        }
                    }
                }
            }

            if (std::any_of(found.begin(), found.end(), [](const std::string &s) { return s.empty(); }))
                return {};

            std::string joined;
            for (const auto &part: found) {
                if (!joined.empty())
                    joined.push_back(' ');
                joined += part;
            }
            std::replace(joined.begin(), joined.end(), '\n', ' ');

            return text::CollapseStutter(text::Strip(joined));
        }

        inline std::string TitleFromLargestSpans(const Page &page, const Settings &settings) {
            double maxSize = 0.0;
            std::set<std::string> candidates;

            for (const auto &block: page.blocks) {
                for (const auto &line: block.lines) {
                    for (const auto &span: line.spans) {
                        std::string t = text::Strip(span.text);
                        if (t.empty())
                            continue;

                        if (SizeExceeds(span.size, maxSize)) {
                            maxSize = span.size;
                            candidates.clear();
                            candidates.insert(std::move(t));
                        } else if (SizeKey(span.size) == SizeKey(maxSize)) {
                            candidates.insert(std::move(t));
                        }
                    }
                }
            }

            if (candidates.empty())
                return {};

            std::vector<std::string> ordered(candidates.begin(), candidates.end());
            std::stable_sort(ordered.begin(), ordered.end(),
                             [](const std::string &a, const std::string &b) {
                                 return text::CharLength(a) > text::CharLength(b);
                             });

            std::string title;
            for (const auto &part: ordered) {
                if (!title.empty())
                    title.push_back(' ');
                title += part;
            }
            title = text::Strip(title);

            if (text::CharLength(title) <= settings.title.minLength || settings.IsNoise(title))
                return {};
            return title;
        }
    } // namespace detail

    [[nodiscard]] inline bool IsBannerTitle(const std::string &title, const TitleRules &rules) {
        return std::any_of(rules.bannerPhrases.begin(), rules.bannerPhrases.end(),
                           [&](const std::string &phrase) { return text::Contains(title, phrase); });
    }

    inline std::string ResolveTitle(const Document &doc, const Settings &settings) {
        if (doc.pages.empty())
            return {};

        const Page &first = doc.pages.front();

        std::string title = detail::TitleFromFragments(first, settings.title);
        if (title.empty())
            title = detail::TitleFromLargestSpans(first, settings);

        if (!title.empty() && IsBannerTitle(title, settings.title))
            title.clear();

        return title;
    }
} // namespace pdfoutline
