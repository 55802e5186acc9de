#pragma once

#include <set>
#include <string>
#include <tuple>
#include <utility>

#include "LayoutTypes.hpp"
#include "Settings.hpp"
#include "StyleProfiler.hpp"

namespace pdfoutline {
    // (text, level, logical page)
    using DedupKey = std::tuple<std::string, Level, int>;

    // Per-document state, created at the start of one extraction and dropped at
    // its end. Nothing in here outlives the document.
    struct ExtractionContext {
        const Settings &settings;
        std::string documentPath;
        StyleProfile profile;
        std::string title;
        int pageOffset = 0;
        std::set<DedupKey> emitted;

        ExtractionContext(const Settings &s, std::string path)
            : settings(s), documentPath(std::move(path)) {
        }

        // Records the entry; false when an identical entry was already emitted.
        bool MarkEmitted(const OutlineEntry &entry) {
            return emitted.emplace(entry.text, entry.level, entry.page).second;
        }

        [[nodiscard]] bool WasEmitted(const OutlineEntry &entry) const {
            return emitted.count(DedupKey{entry.text, entry.level, entry.page}) != 0;
        }

        [[nodiscard]] int LogicalPage(const int physicalIndex) const noexcept {
            return physicalIndex + 1 + pageOffset;
        }
    };
} // namespace pdfoutline
