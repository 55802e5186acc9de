#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ExtractionContext.hpp"
#include "LayoutSource.hpp"
#include "LayoutTypes.hpp"
#include "Settings.hpp"

namespace pdfoutline {
    class OutlineExtractor {
    public:
        explicit OutlineExtractor(const Settings &settings);

        // Full pipeline for a decoded document. Throws on failure.
        [[nodiscard]] Outline Extract(const Document &doc) const;

        // Document boundary: load + extract. Never throws; failures come back
        // in Outline::error with an empty title and outline.
        [[nodiscard]] Outline Run(const std::string &path, const LayoutSource &source) const;

    private:
        // Rolling state while walking the lines of one page.
        struct LineFold {
            std::optional<BBox> previous;
            std::vector<HeadingCandidate> candidates;
        };

        LineFold ConsumeLine(LineFold acc,
                             const Line &line,
                             const Page &page,
                             int logicalPage,
                             ExtractionContext &ctx) const;

        std::vector<OutlineEntry> ProcessPage(const Page &page, ExtractionContext &ctx) const;

        const Settings &m_settings;
    };
} // namespace pdfoutline
