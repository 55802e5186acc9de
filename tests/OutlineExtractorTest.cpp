#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "LayoutFixtures.hpp"
#include "OutlineExtractor.h"

using namespace pdfoutline;
using namespace pdfoutline::fixtures;

namespace {
    class StaticLayoutSource final : public LayoutSource {
    public:
        explicit StaticLayoutSource(Document doc) : m_doc(std::move(doc)) {
        }

        [[nodiscard]] Document Load(const std::string &) const override { return m_doc; }

    private:
        Document m_doc;
    };

    class FailingLayoutSource final : public LayoutSource {
    public:
        [[nodiscard]] Document Load(const std::string &path) const override {
            throw std::runtime_error("Cannot open " + path + ": not a PDF or corrupted");
        }
    };

    std::vector<Line> Concat(std::vector<Line> a, const std::vector<Line> &b) {
        a.insert(a.end(), b.begin(), b.end());
        return a;
    }

    // Cover page with the title, a numbered section page, and a page that only
    // repeats the title above a page number.
    Document ReportDocument(const std::string &path) {
        Page cover = MakePage(0, Concat({LineAt("Quarterly Planning Report", 24.0, true, 80.0)},
                                        BodyLines(3, 140.0)));

        std::vector<Line> sectionLines{LineAt("1. Introduction", 16.0, true, 72.0)};
        sectionLines = Concat(std::move(sectionLines), BodyLines(3, 110.0));
        sectionLines.push_back(LineAt("1.1 Background work", 13.0, true, 200.0));
        sectionLines = Concat(std::move(sectionLines), BodyLines(3, 230.0));
        Page section = MakePage(1, std::move(sectionLines));

        Page closing = MakePage(2, {
                                    LineAt("Quarterly Planning Report", 24.0, true, 80.0),
                                    LineAt("Page 3", 9.0, false, 760.0)
                                });

        return MakeDocument(path, {std::move(cover), std::move(section), std::move(closing)});
    }

    std::vector<OutlineEntry> Entries(std::initializer_list<OutlineEntry> list) {
        return list;
    }
}

TEST(OutlineExtractor, ExtractsTitleAndHeadings) {
    const Settings settings = TestSettings();
    const OutlineExtractor extractor(settings);

    const Outline outline = extractor.Extract(ReportDocument("data/report.pdf"));

    EXPECT_EQ(outline.title, "Quarterly Planning Report");
    EXPECT_EQ(outline.entries, Entries({
                  {Level::H1, "Quarterly Planning Report", 1},
                  {Level::H1, "1. Introduction", 2},
                  {Level::H2, "1.1 Background work", 2}
                  }));
    EXPECT_FALSE(outline.error.has_value());
}

TEST(OutlineExtractor, PageOffsetSkipsCoverPage) {
    Settings settings = TestSettings();
    settings.pageOffsets.push_back({boost::regex(R"(report\.pdf$)"), -1});
    const OutlineExtractor extractor(settings);

    const Outline outline = extractor.Extract(ReportDocument("data/report.pdf"));

    EXPECT_EQ(outline.title, "Quarterly Planning Report");
    EXPECT_EQ(outline.entries, Entries({
                  {Level::H1, "1. Introduction", 1},
                  {Level::H2, "1.1 Background work", 1}
                  }));
}

TEST(OutlineExtractor, PageOffsetOnlyAppliesToMatchingDocument) {
    Settings settings = TestSettings();
    settings.pageOffsets.push_back({boost::regex(R"(other\.pdf$)"), -1});
    const OutlineExtractor extractor(settings);

    const Outline outline = extractor.Extract(ReportDocument("data/report.pdf"));

    ASSERT_FALSE(outline.entries.empty());
    EXPECT_EQ(outline.entries.front().page, 1);
}

TEST(OutlineExtractor, DuplicateHeadingsOnOnePageAreEmittedOnce) {
    const Settings settings = TestSettings();
    const OutlineExtractor extractor(settings);

    std::vector<Line> lines{LineAt("Results Overview", 16.0, true, 72.0)};
    lines = Concat(std::move(lines), BodyLines(4, 110.0));
    lines.push_back(LineAt("Results Overview", 16.0, true, 400.0));
    const Document doc = MakeDocument("dup.pdf", {MakePage(0, std::move(lines))});

    const Outline outline = extractor.Extract(doc);

    EXPECT_EQ(outline.entries, Entries({{Level::H1, "Results Overview", 1}}));
}

TEST(OutlineExtractor, LongBodyLinesAreNeverHeadings) {
    const Settings settings = TestSettings();
    const OutlineExtractor extractor(settings);

    const std::string longLine =
            "This bold paragraph keeps going with many more words than any sensible heading "
            "would ever carry in a real document written today by our busy team";
    ASSERT_GT(text::WordCount(longLine), 24u);

    std::vector<Line> lines{LineAt("Project Charter", 20.0, true, 60.0),
                            LineAt(longLine, 16.0, true, 200.0)};
    lines = Concat(std::move(lines), BodyLines(4, 260.0));
    const Document doc = MakeDocument("charter.pdf", {MakePage(0, std::move(lines))});

    const Outline outline = extractor.Extract(doc);

    EXPECT_EQ(outline.entries, Entries({{Level::H1, "Project Charter", 1}}));
}

TEST(OutlineExtractor, SuppressedLineIsDroppedOnlyWhereScoped) {
    Settings settings = TestSettings();
    OverrideRule rule = MakeOverride("odl-body", "will make Ontario a better place");
    rule.suppress = true;
    rule.documentPattern = boost::regex(R"(file03\.pdf$)");
    rule.physicalPages = {0};
    settings.overrides.push_back(rule);
    const OutlineExtractor extractor(settings);

    std::vector<Line> lines{LineAt("Digital Strategy", 16.0, true, 60.0),
                            LineAt("The Library will make Ontario a better place", 13.0, true, 200.0)};
    lines = Concat(std::move(lines), BodyLines(4, 260.0));
    const Page page = MakePage(0, std::move(lines));

    const Outline scoped = extractor.Extract(MakeDocument("data/file03.pdf", {page}));
    EXPECT_EQ(scoped.entries, Entries({{Level::H1, "Digital Strategy", 1}}));

    const Outline unscoped = extractor.Extract(MakeDocument("data/file04.pdf", {page}));
    EXPECT_EQ(unscoped.entries.size(), 2u);
}

TEST(OutlineExtractor, RepeatedExtractionIsIdentical) {
    const Settings settings = TestSettings();
    const OutlineExtractor extractor(settings);
    const Document doc = ReportDocument("data/report.pdf");

    const Outline first = extractor.Extract(doc);
    const Outline second = extractor.Extract(doc);

    EXPECT_EQ(first.title, second.title);
    EXPECT_EQ(first.entries, second.entries);
}

TEST(OutlineExtractor, RunReturnsOutlineFromLayoutSource) {
    const Settings settings = TestSettings();
    const OutlineExtractor extractor(settings);
    const StaticLayoutSource source(ReportDocument("data/report.pdf"));

    const Outline outline = extractor.Run("data/report.pdf", source);

    EXPECT_FALSE(outline.error.has_value());
    EXPECT_EQ(outline.entries.size(), 3u);
}

TEST(OutlineExtractor, RunDiscardsEverythingOnFailure) {
    const Settings settings = TestSettings();
    const OutlineExtractor extractor(settings);
    const FailingLayoutSource source{};

    const Outline outline = extractor.Run("data/broken.pdf", source);

    EXPECT_EQ(outline.title, "");
    EXPECT_TRUE(outline.entries.empty());
    ASSERT_TRUE(outline.error.has_value());
    EXPECT_NE(outline.error->find("data/broken.pdf"), std::string::npos);
}

TEST(OutlineExtractor, EmptyDocumentGivesEmptyOutline) {
    const Settings settings = TestSettings();
    const OutlineExtractor extractor(settings);

    const Outline outline = extractor.Extract(MakeDocument("empty.pdf", {MakePage(0, {}), MakePage(1, {})}));

    EXPECT_EQ(outline.title, "");
    EXPECT_TRUE(outline.entries.empty());
}
