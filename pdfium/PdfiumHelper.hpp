#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>


// PDFium public headers.
#include "fpdfview.h"
#include "fpdf_text.h"

#include "LayoutBuilder.hpp"
#include "LayoutSource.hpp"
#include "LayoutTypes.hpp"
#include "TextUtil.hpp"

namespace pdfoutline::pdfium {
    // ============================================================
    //  PdfiumLibrary (process-wide RAII + global mutex)
    // ============================================================
    class PdfiumLibrary {
    public:
        PdfiumLibrary(const PdfiumLibrary &) = delete;

        PdfiumLibrary &operator=(const PdfiumLibrary &) = delete;

        static PdfiumLibrary &Instance() {
            static PdfiumLibrary instance;
            return instance;
        }

        // PDFium is not thread-safe: every call goes through this mutex.
        std::mutex &Mutex() noexcept { return mutex_; }

    private:
        PdfiumLibrary() {
            FPDF_InitLibrary();
        }

        ~PdfiumLibrary() {
            FPDF_DestroyLibrary();
        }

        std::mutex mutex_;
    };

    inline std::string DescribeLoadError(const unsigned long err) {
        switch (err) {
            case FPDF_ERR_FILE: return "file not found or could not be opened";
            case FPDF_ERR_FORMAT: return "not a PDF or corrupted";
            case FPDF_ERR_PASSWORD: return "password required or incorrect";
            case FPDF_ERR_SECURITY: return "unsupported security scheme";
            case FPDF_ERR_PAGE: return "page not found or content error";
            default: return "unknown error";
        }
    }

    // ============================================================
    //  RAII wrappers: Document & Page
    // ============================================================
    class Document {
    public:
        Document() = default;

        explicit Document(const std::string &path,
                          const std::string &password = {}) {
            Open(path, password);
        }

        ~Document() {
            Reset();
        }

        Document(const Document &) = delete;

        Document &operator=(const Document &) = delete;

        Document(Document &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Document &operator=(Document &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        void Open(const std::string &path,
                  const std::string &password = {}) {
            Reset();

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadDocument(
                path.c_str(),
                password.empty() ? nullptr : password.c_str());

            if (!handle_) {
                const unsigned long err = FPDF_GetLastError();
                throw std::runtime_error("Cannot open " + path + ": " + DescribeLoadError(err) +
                                         " (FPDF error " + std::to_string(err) + ")");
            }
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_CloseDocument(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] FPDF_DOCUMENT Get() const noexcept { return handle_; }

        [[nodiscard]] int GetPageCount() const {
            if (!handle_)
                return 0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageCount(handle_);
        }

    private:
        FPDF_DOCUMENT handle_ = nullptr;
    };

    class Page {
    public:
        Page() = default;

        Page(FPDF_DOCUMENT doc, const int index) {
            Open(doc, index);
        }

        ~Page() {
            Reset();
        }

        Page(const Page &) = delete;

        Page &operator=(const Page &) = delete;

        Page(Page &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Page &operator=(Page &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        void Open(FPDF_DOCUMENT doc, const int index) {
            Reset();
            if (!doc)
                throw std::runtime_error("Page::Open: null document handle");

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadPage(doc, index);
            if (!handle_)
                throw std::runtime_error("FPDF_LoadPage failed at index " +
                                         std::to_string(index));
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_ClosePage(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] FPDF_PAGE Get() const noexcept { return handle_; }

        [[nodiscard]] double Width() const {
            if (!handle_) return 0.0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageWidth(handle_);
        }

        [[nodiscard]] double Height() const {
            if (!handle_) return 0.0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageHeight(handle_);
        }

    private:
        FPDF_PAGE handle_ = nullptr;
    };

    namespace detail {
        inline std::string FontName(FPDF_TEXTPAGE textPage, const int index) {
            char buffer[256] = {};
            int flags = 0;
            const unsigned long needed =
                    FPDFText_GetFontInfo(textPage, index, buffer, sizeof(buffer), &flags);
            if (needed == 0 || needed > sizeof(buffer))
                return {};
            return std::string(buffer);
        }
    } // namespace detail

    // Decodes one page into blocks / lines / spans (top-down coordinates).
    inline pdfoutline::Page ExtractPageLayout(const Page &page, const int index) {
        const double width = page.Width();
        const double height = page.Height();
        PageBuilder builder(index, width, height);

        auto &lib = PdfiumLibrary::Instance();
        std::lock_guard lock(lib.Mutex());

        // Pdfium handles must stay non-const; the deleter runs while the lock
        // above is still held.
        using TextPageHandle = std::unique_ptr<std::remove_pointer_t<FPDF_TEXTPAGE>,
            decltype(&FPDFText_ClosePage)>;
        const TextPageHandle textPage(FPDFText_LoadPage(page.Get()), &FPDFText_ClosePage);
        if (!textPage)
            return builder.Finish();

        const int nChars = FPDFText_CountChars(textPage.get());
        for (int i = 0; i < nChars; ++i) {
            const auto cp = static_cast<char32_t>(FPDFText_GetUnicode(textPage.get(), i));
            if (cp == 0 || cp == 0xFFFE || cp == 0xFFFF)
                continue;

            if (cp == U'\r' || cp == U'\n') {
                builder.BreakLine();
                continue;
            }
            if (text::IsWhitespace(cp)) {
                builder.AddSpace();
                continue;
            }

            // Loose boxes span the font's ascent and descent, so glyphs of one
            // line share their vertical extent regardless of shape.
            FS_RECTF rect{};
            if (!FPDFText_GetLooseCharBox(textPage.get(), i, &rect))
                continue;

            Glyph g;
            g.cp = cp;
            g.size = RoundSize(FPDFText_GetFontSize(textPage.get(), i));
            g.font = detail::FontName(textPage.get(), i);
            // PDFium is bottom-up; the layout model is top-down.
            g.box = BBox{rect.left, height - rect.top, rect.right, height - rect.bottom};
            builder.Add(g);
        }

        return builder.Finish();
    }

    // ============================================================
    //  LayoutSource backed by PDFium
    // ============================================================
    class PdfiumLayoutSource final : public LayoutSource {
    public:
        [[nodiscard]] pdfoutline::Document Load(const std::string &path) const override {
            (void) PdfiumLibrary::Instance();

            const Document doc(path);
            const int pageCount = doc.GetPageCount();

            pdfoutline::Document layout;
            layout.path = path;
            layout.pages.reserve(pageCount > 0 ? static_cast<std::size_t>(pageCount) : 0);

            for (int i = 0; i < pageCount; ++i) {
                const Page page(doc.Get(), i);
                layout.pages.push_back(ExtractPageLayout(page, i));
            }

            return layout;
        }
    };
} // namespace pdfoutline::pdfium
