#pragma once

#include <string>

#include "LayoutTypes.hpp"

namespace pdfoutline {
    // Decodes a document file into spans / lines / blocks / pages.
    // Implementations throw std::runtime_error when the file cannot be read.
    class LayoutSource {
    public:
        virtual ~LayoutSource() = default;

        [[nodiscard]] virtual Document Load(const std::string &path) const = 0;
    };
} // namespace pdfoutline
