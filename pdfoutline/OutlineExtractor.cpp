// OutlineExtractor.cpp

#include "OutlineExtractor.h"

#include <QDebug>
#include <QString>

#include <exception>
#include <iterator>
#include <utility>

#include "HeadingClassifier.hpp"
#include "LevelAssigner.hpp"
#include "PageCurator.hpp"
#include "StyleProfiler.hpp"
#include "TextUtil.hpp"
#include "TitleResolver.hpp"

namespace pdfoutline {
    OutlineExtractor::OutlineExtractor(const Settings &settings)
        : m_settings(settings) {
    }

    OutlineExtractor::LineFold OutlineExtractor::ConsumeLine(LineFold acc,
                                                             const Line &line,
                                                             const Page &page,
                                                             const int logicalPage,
                                                             ExtractionContext &ctx) const {
        const std::string text = text::Strip(line.RawText());
        if (text.empty() || line.spans.empty())
            return acc;

        const auto bodyLimit = static_cast<std::size_t>(m_settings.thresholds.maxWordsForBoldHeading) * 2;
        if (m_settings.IsNoise(text) || text::WordCount(text) > bodyLimit) {
            acc.previous = line.bbox;
            return acc;
        }

        const LineContext lineCtx{text, line.spans.front(), line.bbox, acc.previous, ctx.documentPath, page.index};
        acc.previous = line.bbox;

        const HeadingRule rule = MatchHeadingRule(lineCtx, ctx.profile, m_settings);
        if (rule == HeadingRule::None)
            return acc;

        // The title is not repeated as a heading on later pages.
        if (!ctx.title.empty() && text == ctx.title && page.index > 0)
            return acc;

        if (const OverrideRule *suppressed = FindSuppression(lineCtx, m_settings)) {
            qDebug() << "Suppressed by" << QString::fromStdString(suppressed->name) << ":"
                     << QString::fromStdString(text);
            return acc;
        }

        const Level level = AssignLevel(lineCtx.first, text, ctx.profile, m_settings,
                                        ctx.documentPath, page.index);
        OutlineEntry entry{level, text, logicalPage};
        if (!ctx.MarkEmitted(entry))
            return acc;

        qDebug().nospace() << "p" << logicalPage << " " << LevelName(level)
                << " [" << HeadingRuleName(rule) << "] " << QString::fromStdString(text);

        acc.candidates.push_back({std::move(entry), line.bbox.y0});
        return acc;
    }

    std::vector<OutlineEntry> OutlineExtractor::ProcessPage(const Page &page, ExtractionContext &ctx) const {
        const int logicalPage = ctx.LogicalPage(page.index);

        LineFold acc;
        for (const auto &block: page.blocks) {
            for (const auto &line: block.lines)
                acc = ConsumeLine(std::move(acc), line, page, logicalPage, ctx);
        }

        const bool noCandidates = acc.candidates.empty();
        std::vector<OutlineEntry> entries = CuratePage(std::move(acc.candidates), page, logicalPage, ctx);

        if (noCandidates) {
            if (entries.empty()) {
                qDebug() << "Page" << logicalPage << ": no heading and no fallback text";
            } else {
                qDebug() << "Page" << logicalPage << ": fallback heading"
                         << QString::fromStdString(entries.front().text);
            }
        }

        return entries;
    }

    Outline OutlineExtractor::Extract(const Document &doc) const {
        ExtractionContext ctx(m_settings, doc.path);
        ctx.profile = ProfileDocument(doc);
        ctx.title = ResolveTitle(doc, m_settings);
        ctx.pageOffset = m_settings.PageOffsetFor(doc.path);

        qDebug() << "Profile for" << QString::fromStdString(doc.path)
                 << ": dominant size" << ctx.profile.dominantFontSize
                 << "," << ctx.profile.fontSizesByProminence.size() << "distinct sizes, page offset"
                 << ctx.pageOffset;

        Outline outline;
        outline.title = ctx.title;

        for (const auto &page: doc.pages) {
            // Cover pages excluded from numbering contribute nothing.
            if (ctx.LogicalPage(page.index) < 1)
                continue;

            std::vector<OutlineEntry> entries = ProcessPage(page, ctx);
            outline.entries.insert(outline.entries.end(),
                                   std::make_move_iterator(entries.begin()),
                                   std::make_move_iterator(entries.end()));
        }

        return outline;
    }

    Outline OutlineExtractor::Run(const std::string &path, const LayoutSource &source) const {
        // All-or-nothing: a failure drops everything gathered so far.
        Outline failed;
        try {
            return Extract(source.Load(path));
        } catch (const std::exception &ex) {
            qWarning() << "Outline extraction failed for" << QString::fromStdString(path) << ":" << ex.what();
            failed.error = ex.what();
        } catch (...) {
            qWarning() << "Unknown error during outline extraction of" << QString::fromStdString(path);
            failed.error = "Unknown error during outline extraction.";
        }
        return failed;
    }
} // namespace pdfoutline
