#pragma once
//
// TextUtil.hpp
// -----------------------------------------------------------------------------
// UTF-8 text helpers shared by the heading heuristics:
// - UTF-8 -> UTF-32 decoding and deterministic Unicode whitespace
// - trimming / word splitting
// - case predicates and case-insensitive search
// - font-name style flags
// - repeat collapse for overprinted title runs
// -----------------------------------------------------------------------------

#include <QChar>
#include <QString>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pdfoutline::text {
    // ---------- Unicode whitespace (deterministic; avoids locale-dependent iswspace) ----------

    [[nodiscard]]
    [[gnu::always_inline]] inline bool IsWhitespace(const char32_t ch) noexcept {
        if (ch == U' ' || ch == U'\t' || ch == U'\n' || ch == U'\r' || ch == U'\f' || ch == U'\v')
            return true;

        switch (ch) {
            case 0x00A0: // NO-BREAK SPACE
            case 0x2000: // EN QUAD
            case 0x2001: // EM QUAD
            case 0x2002: // EN SPACE
            case 0x2003: // EM SPACE
            case 0x2004: // THREE-PER-EM SPACE
            case 0x2005: // FOUR-PER-EM SPACE
            case 0x2006: // SIX-PER-EM SPACE
            case 0x2007: // FIGURE SPACE
            case 0x2008: // PUNCTUATION SPACE
            case 0x2009: // THIN SPACE
            case 0x200A: // HAIR SPACE
            case 0x2028: // LINE SEPARATOR
            case 0x2029: // PARAGRAPH SEPARATOR
            case 0x202F: // NARROW NO-BREAK SPACE
            case 0x205F: // MEDIUM MATHEMATICAL SPACE
            case 0x3000: // IDEOGRAPHIC SPACE
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]] inline bool IsAsciiDigit(const char32_t ch) noexcept {
        return ch >= U'0' && ch <= U'9';
    }

    // ---------- UTF-8 <-> UTF-32 ----------

    inline std::u32string Utf8ToU32(const std::string_view s) {
        std::u32string out;
        out.reserve(s.size());

        auto p = reinterpret_cast<const unsigned char *>(s.data());
        const unsigned char *end = p + s.size();

        while (p < end) {
            uint32_t ch = 0;

            if (const unsigned char c = *p++; c < 0x80) {
                ch = c;
            } else if ((c >> 5) == 0x6 && p < end) {
                ch = ((c & 0x1F) << 6);
                ch |= (*p++ & 0x3F);
            } else if ((c >> 4) == 0xE && p + 1 < end) {
                ch = ((c & 0x0F) << 12);
                ch |= ((p[0] & 0x3F) << 6);
                ch |= ((p[1] & 0x3F));
                p += 2;
            } else if ((c >> 3) == 0x1E && p + 2 < end) {
                ch = ((c & 0x07) << 18);
                ch |= ((p[0] & 0x3F) << 12);
                ch |= ((p[1] & 0x3F) << 6);
                ch |= ((p[2] & 0x3F));
                p += 3;
            } else {
                ch = 0xFFFD;
            }

            out.push_back(static_cast<char32_t>(ch));
        }

        return out;
    }

    inline void AppendUtf8(std::string &out, const char32_t ch) {
        if (const auto c = static_cast<uint32_t>(ch); c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else if (c < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        } else if (c < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (c >> 12)));
            out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (c >> 18)));
            out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }

    inline std::string U32ToUtf8(const std::u32string_view s) {
        std::string out;
        out.reserve(s.size() * 3);
        for (const char32_t ch: s)
            AppendUtf8(out, ch);
        return out;
    }

    // Length in code points.
    [[nodiscard]] inline std::size_t CharLength(const std::string_view s) {
        return Utf8ToU32(s).size();
    }

    // ---------- Trimming / tokens ----------

    inline std::string Strip(const std::string_view s) {
        const std::u32string u = Utf8ToU32(s);
        std::size_t start = 0;
        std::size_t end = u.size();

        while (start < end && IsWhitespace(u[start]))
            ++start;
        while (end > start && IsWhitespace(u[end - 1]))
            --end;

        return U32ToUtf8(std::u32string_view(u).substr(start, end - start));
    }

    // Words separated by runs of Unicode whitespace; empty words are dropped.
    inline std::vector<std::string> SplitWords(const std::string_view s) {
        std::vector<std::string> words;
        std::u32string current;

        for (const char32_t ch: Utf8ToU32(s)) {
            if (IsWhitespace(ch)) {
                if (!current.empty()) {
                    words.push_back(U32ToUtf8(current));
                    current.clear();
                }
                continue;
            }
            current.push_back(ch);
        }
        if (!current.empty())
            words.push_back(U32ToUtf8(current));

        return words;
    }

    [[nodiscard]] inline std::size_t WordCount(const std::string_view s) {
        return SplitWords(s).size();
    }

    [[nodiscard]] inline bool EndsWith(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    [[nodiscard]] inline bool Contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    // "123" -> true, "" / "12a" / "1.2" -> false
    [[nodiscard]] inline bool IsAllDigits(const std::string_view s) {
        const std::u32string u = Utf8ToU32(s);
        return !u.empty() && std::all_of(u.begin(), u.end(), IsAsciiDigit);
    }

    // ---------- Case ----------

    // At least one cased character and no lowercase or titlecase ones.
    [[nodiscard]] inline bool IsUpper(const std::string_view s) {
        bool hasCased = false;
        for (const char32_t ch: Utf8ToU32(s)) {
            if (QChar::isLower(ch) || QChar::isTitleCase(ch))
                return false;
            if (QChar::isUpper(ch))
                hasCased = true;
        }
        return hasCased;
    }

    [[nodiscard]] inline bool ContainsIgnoreCase(const std::string_view haystack, const std::string_view needle) {
        const QString h = QString::fromUtf8(haystack.data(), static_cast<qsizetype>(haystack.size()));
        const QString n = QString::fromUtf8(needle.data(), static_cast<qsizetype>(needle.size()));
        return h.contains(n, Qt::CaseInsensitive);
    }

    // ---------- Font-name style flags ----------

    [[nodiscard]] inline bool IsBoldFontName(const std::string_view font) {
        return ContainsIgnoreCase(font, "bold") ||
               ContainsIgnoreCase(font, "black") ||
               ContainsIgnoreCase(font, "heavy");
    }

    [[nodiscard]] inline bool IsItalicFontName(const std::string_view font) {
        return ContainsIgnoreCase(font, "italic") ||
               ContainsIgnoreCase(font, "oblique");
    }

    // ------------------------------------------------------------
    // Repeat collapse for overprinted title runs.
    //
    // Fake-bold and shadowed titles are often emitted twice or with
    // stuttering glyphs ("Reeeequest foooor"). These helpers undo the
    // two common artifacts without touching ordinary words:
    //   - a letter repeated 4+ times in a row is reduced to one
    //     ("III" and "www" are left alone)
    //   - an adjacent duplicate word (case-insensitive) is dropped
    // ------------------------------------------------------------

    inline constexpr std::size_t kStutterRun = 4;

    inline std::string CollapseRepeatedLetters(const std::string_view word) {
        const std::u32string u = Utf8ToU32(word);
        std::u32string out;
        out.reserve(u.size());

        for (std::size_t i = 0; i < u.size();) {
            std::size_t run = 1;
            while (i + run < u.size() && u[i + run] == u[i])
                ++run;

            if (run >= kStutterRun && QChar::isLetter(u[i])) {
                out.push_back(u[i]);
            } else {
                out.append(u, i, run);
            }
            i += run;
        }

        return U32ToUtf8(out);
    }

    inline std::string CollapseStutter(const std::string_view s) {
        std::vector<std::string> kept;

        for (const auto &word: SplitWords(s)) {
            std::string collapsed = CollapseRepeatedLetters(word);
            if (!kept.empty()) {
                const QString prev = QString::fromStdString(kept.back());
                if (prev.compare(QString::fromStdString(collapsed), Qt::CaseInsensitive) == 0)
                    continue;
            }
            kept.push_back(std::move(collapsed));
        }

        std::string out;
        for (std::size_t i = 0; i < kept.size(); ++i) {
            if (i > 0)
                out.push_back(' ');
            out += kept[i];
        }
        return out;
    }
} // namespace pdfoutline::text
