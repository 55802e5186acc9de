#pragma once

#include <string>
#include <utility>

#include "LayoutTypes.hpp"
#include "TextUtil.hpp"

namespace pdfoutline::pdfium {
    // ============================================================
    //  Glyph stream -> spans -> lines -> blocks
    //  (no PDFium types here; the adapter feeds decoded glyphs)
    // ============================================================

    // Horizontal gap (in font sizes) that inserts a word space...
    inline constexpr double kWordGap = 0.25;
    // ...and the gap that starts a new line (next column / table cell).
    inline constexpr double kColumnGap = 2.0;
    // A glyph stays on the current line while its vertical centre lies within
    // [baseline - size, baseline + size * kBaselineSlack].
    inline constexpr double kBaselineSlack = 0.25;

    // One decoded character, box in top-down page coordinates.
    struct Glyph {
        char32_t cp = 0;
        double size = 0.0;
        std::string font;
        BBox box;
    };

    // Accumulates glyphs of one page into the layout model.
    class PageBuilder {
    public:
        PageBuilder(const int index, const double width, const double height) {
            page_.index = index;
            page_.width = width;
            page_.height = height;
        }

        void Add(const Glyph &g) {
            if (open_) {
                const double gap = g.box.x0 - lastRight_;

                if (!OnCurrentLine(g) || gap > span_.size * kColumnGap) {
                    BreakLine();
                } else if (g.font != span_.font || SizeKey(g.size) != SizeKey(span_.size)) {
                    if (pendingSpace_)
                        span_.text.push_back(' ');
                    FlushSpan();
                } else if (pendingSpace_ || gap > span_.size * kWordGap) {
                    span_.text.push_back(' ');
                }
            }

            if (!open_) {
                // The bottom of a line's first glyph serves as its baseline.
                if (line_.spans.empty())
                    baseline_ = g.box.y1;

                span_ = Span{};
                span_.size = g.size;
                span_.font = g.font;
                span_.bold = text::IsBoldFontName(g.font);
                span_.italic = text::IsItalicFontName(g.font);
                span_.bbox = g.box;
                open_ = true;
            }

            text::AppendUtf8(span_.text, g.cp);
            span_.bbox.Unite(g.box);
            lastRight_ = g.box.x1;
            pendingSpace_ = false;
        }

        void AddSpace() noexcept {
            if (open_)
                pendingSpace_ = true;
        }

        void BreakLine() {
            FlushSpan();
            if (line_.spans.empty())
                return;

            // Lines stay in one block while the vertical gap is below the
            // previous line's height.
            bool newBlock = page_.blocks.empty();
            if (!newBlock) {
                const Line &prev = page_.blocks.back().lines.back();
                newBlock = line_.bbox.y0 - prev.bbox.y1 >= prev.bbox.Height();
            }
            if (newBlock)
                page_.blocks.emplace_back();

            page_.blocks.back().lines.push_back(std::move(line_));
            line_ = Line{};
        }

        pdfoutline::Page Finish() {
            BreakLine();
            return std::move(page_);
        }

    private:
        // Punctuation and descenders have tight boxes far from the cap
        // height, so only the glyph's centre is compared with the baseline.
        [[nodiscard]] bool OnCurrentLine(const Glyph &g) const noexcept {
            const double size = span_.size > 0.0 ? span_.size : g.size;
            const double centre = (g.box.y0 + g.box.y1) / 2.0;
            return centre >= baseline_ - size && centre <= baseline_ + size * kBaselineSlack;
        }

        void FlushSpan() {
            if (!open_)
                return;
            open_ = false;
            pendingSpace_ = false;

            if (line_.spans.empty())
                line_.bbox = span_.bbox;
            else
                line_.bbox.Unite(span_.bbox);
            line_.spans.push_back(std::move(span_));
        }

        pdfoutline::Page page_;
        Line line_;
        Span span_;
        bool open_ = false;
        bool pendingSpace_ = false;
        double lastRight_ = 0.0;
        double baseline_ = 0.0;
    };
} // namespace pdfoutline::pdfium
