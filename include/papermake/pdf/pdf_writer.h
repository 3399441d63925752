// papermake/pdf/pdf_writer.h
#ifndef PAPERMAKE_PDF_PDF_WRITER_H
#define PAPERMAKE_PDF_PDF_WRITER_H

#include "papermake/common/types.h"
#include "papermake/typeset/document.h"
#include <optional>
#include <string>
#include <string_view>

namespace papermake {

struct PaperSize {
    std::string name;
    double width_pt;
    double height_pt;
};

// a3, a4, a5, letter, legal (case-insensitive)
std::optional<PaperSize> lookup_paper_size(std::string_view name);

struct PdfOptions {
    PaperSize paper{"a4", 595.28, 841.89};
    bool compress = true;
    size_t max_pages = 500;
};

// Writes a PDF 1.4 file using the standard Helvetica fonts. Output depends only
// on the document and options. Throws EncodeError.
Bytes encode_pdf(const Document& doc, const PdfOptions& options);

// Width of UTF-8 text in points for the given font size
double text_width(std::string_view utf8, double font_size, bool bold);

// UTF-8 to the single-byte WinAnsiEncoding used by the standard fonts; unmappable
// code points become '?'
std::string to_win_ansi(std::string_view utf8);

} // namespace papermake

#endif // PAPERMAKE_PDF_PDF_WRITER_H
