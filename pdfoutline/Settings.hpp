#pragma once
//
// Settings.hpp
// -----------------------------------------------------------------------------
// Immutable heuristic configuration. Loaded once per process (see
// src/settings_loader.h) and passed by const reference to every stage.
// -----------------------------------------------------------------------------

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "LayoutTypes.hpp"

namespace pdfoutline {
    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct HeadingThresholds {
        double fontSizeDifferenceFromDominant = 2.0;
        double boldFontSizeMinRatioToDominant = 0.9;
        int maxWordsForBoldHeading = 12;
        int maxWordsForAllCapsHeading = 10;
    };

    // Minimum prominence a span needs before an override rule applies.
    //
    // Passes when:
    //   (requireBold => bold)
    //   && (maxWords == 0 || words < maxWords)
    //   && (size >= dominant + minSizeDelta || (boldPasses && bold))
    struct ProminenceGate {
        double minSizeDelta = 0.0;
        bool boldPasses = true;
        bool requireBold = false;
        int maxWords = 0;

        [[nodiscard]] bool Passes(const double size,
                                  const bool bold,
                                  const std::size_t words,
                                  const double dominant) const noexcept {
            if (requireBold && !bold)
                return false;
            if (maxWords > 0 && words >= static_cast<std::size_t>(maxWords))
                return false;
            return SizeAtLeast(size, dominant + minSizeDelta) || (boldPasses && bold);
        }
    };

    // One row of the phrase -> level override table.
    struct OverrideRule {
        std::string name;
        boost::regex pattern;
        std::optional<Level> level;
        std::optional<ProminenceGate> classifyGate;
        std::optional<ProminenceGate> levelGate;
        bool suppress = false;
        std::optional<boost::regex> documentPattern;
        std::vector<int> physicalPages;

        [[nodiscard]] bool AppliesTo(const std::string &documentPath, const int physicalPage) const {
            if (documentPattern && !boost::regex_search(documentPath, *documentPattern))
                return false;
            if (!physicalPages.empty() &&
                std::find(physicalPages.begin(), physicalPages.end(), physicalPage) == physicalPages.end())
                return false;
            return true;
        }

        [[nodiscard]] bool Matches(const std::string &text) const {
            return boost::regex_search(text, pattern);
        }
    };

    struct PageOffsetRule {
        boost::regex documentPattern;
        int offset = 0;
    };

    struct TitleRules {
        std::vector<std::string> fragments;
        std::vector<std::string> bannerPhrases;
        std::size_t minLength = 5;
    };

    struct Settings {
        HeadingThresholds thresholds;
        std::vector<std::string> headingKeywords;
        std::vector<boost::regex> noisePatterns;
        int maxHeadingsPerPage = 4;
        std::vector<OverrideRule> overrides;
        std::vector<PageOffsetRule> pageOffsets;
        TitleRules title;

        // Header / footer boilerplate ("Page 3 of 10", copyright lines, ...).
        [[nodiscard]] bool IsNoise(const std::string &text) const {
            return std::any_of(noisePatterns.begin(), noisePatterns.end(),
                               [&](const boost::regex &re) { return boost::regex_search(text, re); });
        }

        // First matching rule wins; 0 when none matches.
        [[nodiscard]] int PageOffsetFor(const std::string &documentPath) const {
            for (const auto &rule: pageOffsets) {
                if (boost::regex_search(documentPath, rule.documentPattern))
                    return rule.offset;
            }
            return 0;
        }
    };

    [[nodiscard]] inline boost::regex MakeNoisePattern(const std::string &pattern) {
        return boost::regex(pattern, boost::regex::perl | boost::regex::icase);
    }
} // namespace pdfoutline
