#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "HeadingClassifier.hpp"
#include "LayoutFixtures.hpp"

using namespace pdfoutline;
using namespace pdfoutline::fixtures;

namespace {
    class HeadingClassifierTest : public ::testing::Test {
    protected:
        HeadingRule Classify(const std::string &text, const double size, const bool bold,
                             const std::optional<BBox> &previous = std::nullopt,
                             const double y = 200.0,
                             const std::string &path = "doc.pdf",
                             const int physicalPage = 0) const {
            const Span span = MakeSpan(text, size, bold, kLeftMargin, y);
            const LineContext line{text, span, span.bbox, previous, path, physicalPage};
            return MatchHeadingRule(line, profile, settings);
        }

        Settings settings = TestSettings();
        StyleProfile profile = BodyProfile();
    };
}

TEST_F(HeadingClassifierTest, LargerThanBodyNeedsStrictMargin) {
    EXPECT_EQ(Classify("Big words", 12.1, false), HeadingRule::LargerThanBody);
    EXPECT_EQ(Classify("Big words", 12.0, false), HeadingRule::None);
}

TEST_F(HeadingClassifierTest, BoldShortLine) {
    EXPECT_EQ(Classify("Project scope", 9.0, true), HeadingRule::BoldShort);
    EXPECT_EQ(Classify("Project scope", 8.9, true), HeadingRule::None);
}

TEST_F(HeadingClassifierTest, BoldLineAtWordCapIsNotAHeadingUnlessUppercase) {
    EXPECT_EQ(Classify("one two three four five six seven eight nine ten eleven twelve", 10.0, true),
              HeadingRule::None);
    EXPECT_EQ(Classify("ONE TWO THREE FOUR FIVE SIX SEVEN EIGHT NINE TEN ELEVEN TWELVE", 10.0, true),
              HeadingRule::BoldShort);
}

TEST_F(HeadingClassifierTest, NumberedHeading) {
    EXPECT_EQ(Classify("2.1 Scope of work", 9.0, false), HeadingRule::Numbered);
    EXPECT_EQ(Classify("3 Goals", 8.0, true), HeadingRule::Numbered);
    EXPECT_EQ(Classify("3 Goals", 8.0, false), HeadingRule::None);
}

TEST_F(HeadingClassifierTest, NumberedListItemAtBodySizeIsNotAHeading) {
    EXPECT_EQ(Classify("1. Install the package and run it.", 10.0, false), HeadingRule::None);
    EXPECT_EQ(Classify("1. Purpose", 9.0, false), HeadingRule::None);
}

TEST_F(HeadingClassifierTest, KeywordNeedsSomeProminence) {
    EXPECT_EQ(Classify("executive summary notes", 10.5, false), HeadingRule::Keyword);
    EXPECT_EQ(Classify("executive summary notes", 10.0, false), HeadingRule::None);
    EXPECT_EQ(Classify("Summary:", 9.0, false), HeadingRule::Keyword);
    EXPECT_EQ(Classify("Summary:", 8.9, false), HeadingRule::None);
}

TEST_F(HeadingClassifierTest, ShortAllCapsLine) {
    EXPECT_EQ(Classify("PROJECT GOALS", 9.0, false), HeadingRule::ShortAllCaps);
    EXPECT_EQ(Classify("PROJECT GOALS", 8.9, false), HeadingRule::None);
    EXPECT_EQ(Classify("ONE TWO THREE FOUR FIVE SIX SEVEN EIGHT NINE TEN", 10.0, false), HeadingRule::None);
}

TEST_F(HeadingClassifierTest, VerticalGapAbove) {
    const BBox previous{kLeftMargin, 90.0, 300.0, 100.0};

    EXPECT_EQ(Classify("Scope of work", 10.0, false, previous, 116.0), HeadingRule::VerticalGap);
    EXPECT_EQ(Classify("Scope of work", 10.0, false, previous, 115.0), HeadingRule::None);
    EXPECT_EQ(Classify("It ended well.", 10.0, false, previous, 140.0), HeadingRule::None);
    EXPECT_EQ(Classify("Scope of work", 9.4, false, previous, 140.0), HeadingRule::None);
}

TEST_F(HeadingClassifierTest, OverrideRowWithClassifyGate) {
    OverrideRule rule = MakeOverride("milestones", "^Milestones$");
    rule.level = Level::H3;
    rule.classifyGate = ProminenceGate{0.0, true, false, 0};
    settings.overrides.push_back(rule);

    EXPECT_EQ(Classify("Milestones", 10.0, false), HeadingRule::Override);
    EXPECT_EQ(Classify("Milestones", 9.5, false), HeadingRule::None);
    EXPECT_EQ(Classify("Milestones ahead", 10.0, false), HeadingRule::None);
}

TEST_F(HeadingClassifierTest, OverrideRowWithoutClassifyGateDoesNotClassify) {
    OverrideRule rule = MakeOverride("milestones", "^Milestones$");
    rule.level = Level::H3;
    settings.overrides.push_back(rule);

    EXPECT_EQ(Classify("Milestones", 10.0, false), HeadingRule::None);
}

TEST_F(HeadingClassifierTest, OverrideRowScopedToDocumentAndPage) {
    OverrideRule rule = MakeOverride("scoped", "^Local services$");
    rule.classifyGate = ProminenceGate{};
    rule.documentPattern = boost::regex(R"(file03\.pdf$)");
    rule.physicalPages = {1};
    settings.overrides.push_back(rule);

    EXPECT_EQ(Classify("Local services", 10.0, false, std::nullopt, 200.0, "data/file03.pdf", 1),
              HeadingRule::Override);
    EXPECT_EQ(Classify("Local services", 10.0, false, std::nullopt, 200.0, "data/file03.pdf", 2),
              HeadingRule::None);
    EXPECT_EQ(Classify("Local services", 10.0, false, std::nullopt, 200.0, "data/file04.pdf", 1),
              HeadingRule::None);
}

TEST_F(HeadingClassifierTest, IsLikelyHeadingMatchesRuleOutcome) {
    const Span big = MakeSpan("Big words", 14.0);
    const Span body = MakeSpan("Plain body text", 10.0);

    EXPECT_TRUE(IsLikelyHeading({"Big words", big, big.bbox, std::nullopt, "doc.pdf", 0}, profile, settings));
    EXPECT_FALSE(IsLikelyHeading({"Plain body text", body, body.bbox, std::nullopt, "doc.pdf", 0}, profile, settings));
}

TEST_F(HeadingClassifierTest, SuppressionRowIsFound) {
    OverrideRule rule = MakeOverride("odl-body", "will make Ontario a better place");
    rule.suppress = true;
    settings.overrides.push_back(rule);

    const std::string text = "The Library will make Ontario a better place";
    const Span span = MakeSpan(text, 13.0, true);
    const LineContext line{text, span, span.bbox, std::nullopt, "doc.pdf", 1};

    const OverrideRule *found = FindSuppression(line, settings);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->name, "odl-body");

    const Span other = MakeSpan("Something else", 13.0, true);
    EXPECT_EQ(FindSuppression({"Something else", other, other.bbox, std::nullopt, "doc.pdf", 1}, settings),
              nullptr);
}

TEST(ProminenceGate, CombinesBoldWordAndSizeConditions) {
    const ProminenceGate gate{-0.5, false, true, 10};

    EXPECT_TRUE(gate.Passes(9.5, true, 4, 10.0));
    EXPECT_FALSE(gate.Passes(9.5, false, 4, 10.0));
    EXPECT_FALSE(gate.Passes(9.4, true, 4, 10.0));
    EXPECT_FALSE(gate.Passes(10.0, true, 10, 10.0));

    const ProminenceGate boldOrBigger{1.0, true, false, 0};
    EXPECT_TRUE(boldOrBigger.Passes(9.0, true, 30, 10.0));
    EXPECT_TRUE(boldOrBigger.Passes(11.0, false, 30, 10.0));
    EXPECT_FALSE(boldOrBigger.Passes(10.9, false, 30, 10.0));
}
