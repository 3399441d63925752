// src/pdf/pdf_writer.cpp
#include "papermake/pdf/pdf_writer.h"
#include "papermake/common/error.h"
#include "papermake/common/log.h"
#include "papermake/pdf/deflate.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <vector>

namespace papermake {

namespace {

constexpr double kMargin = 56.69; // 2 cm
constexpr double kBodySize = 11.0;
constexpr double kBodyLeading = 14.5;
constexpr double kParagraphGap = 6.0;
constexpr double kListIndent = 14.0;
constexpr double kBoldWidthFactor = 1.06;
constexpr char kBullet = '\x95';

// Helvetica advance widths (1/1000 em) for codes 32..126
constexpr std::array<int, 95> kHelveticaWidths = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584};

constexpr int kDefaultWidth = 556;

struct PlacedLine {
    double x;
    double y;
    double size;
    bool bold;
    std::string text; // WinAnsi
};

struct Page {
    std::vector<PlacedLine> lines;
};

double char_width(unsigned char c) {
    if (c >= 32 && c <= 126) return kHelveticaWidths[c - 32];
    if (c == static_cast<unsigned char>(kBullet)) return 350;
    return kDefaultWidth;
}

double ansi_width(std::string_view ansi, double size, bool bold) {
    double units = 0;
    for (char c : ansi) units += char_width(static_cast<unsigned char>(c));
    double width = units * size / 1000.0;
    return bold ? width * kBoldWidthFactor : width;
}

// Greedy word wrap; words wider than the line are split between characters
std::vector<std::string> wrap(const std::string& ansi, double max_width, double size, bool bold) {
    std::vector<std::string> lines;
    std::string current;

    size_t pos = 0;
    while (pos < ansi.size()) {
        size_t space = ansi.find(' ', pos);
        std::string word = ansi.substr(pos, space == std::string::npos ? std::string::npos : space - pos);
        pos = (space == std::string::npos) ? ansi.size() : space + 1;
        if (word.empty()) continue;

        std::string candidate = current.empty() ? word : current + " " + word;
        if (ansi_width(candidate, size, bold) <= max_width) {
            current = std::move(candidate);
            continue;
        }
        if (!current.empty()) {
            lines.push_back(std::move(current));
            current.clear();
        }
        while (ansi_width(word, size, bold) > max_width && word.size() > 1) {
            size_t cut = 1;
            while (cut < word.size() && ansi_width(word.substr(0, cut + 1), size, bold) <= max_width) ++cut;
            lines.push_back(word.substr(0, cut));
            word.erase(0, cut);
        }
        current = std::move(word);
    }
    if (!current.empty()) lines.push_back(std::move(current));
    return lines;
}

class Layout {
public:
    explicit Layout(const PaperSize& paper)
        : width_(paper.width_pt), height_(paper.height_pt) {
        new_page();
    }

    void heading(const std::string& ansi, int level) {
        double size = level <= 1 ? 20.0 : (level == 2 ? 16.0 : 13.0);
        if (!pages_.back().lines.empty()) advance(size * 0.8);
        emit(ansi, kMargin, size, size * 1.25, true);
        advance(size * 0.3);
    }

    void paragraph(const std::string& ansi) {
        emit(ansi, kMargin, kBodySize, kBodyLeading, false);
        advance(kParagraphGap);
    }

    void list_item(const std::string& ansi) {
        ensure_room(kBodyLeading);
        pages_.back().lines.push_back({kMargin, y_ - kBodySize, kBodySize, false, std::string(1, kBullet)});
        if (emit(ansi, kMargin + kListIndent, kBodySize, kBodyLeading, false) == 0) {
            advance(kBodyLeading);
        }
        advance(kParagraphGap / 2);
    }

    void page_break() {
        if (!pages_.back().lines.empty()) new_page();
    }

    const std::vector<Page>& pages() const { return pages_; }

private:
    void new_page() {
        pages_.emplace_back();
        y_ = height_ - kMargin;
    }

    void ensure_room(double leading) {
        if (y_ - leading < kMargin && !pages_.back().lines.empty()) new_page();
    }

    void advance(double amount) {
        y_ -= amount;
    }

    // Returns the number of lines placed
    size_t emit(const std::string& ansi, double x, double size, double leading, bool bold) {
        double max_width = width_ - kMargin - x;
        auto lines = wrap(ansi, max_width, size, bold);
        for (auto& line : lines) {
            ensure_room(leading);
            pages_.back().lines.push_back({x, y_ - size, size, bold, std::move(line)});
            y_ -= leading;
        }
        return lines.size();
    }

    double width_;
    double height_;
    double y_ = 0;
    std::vector<Page> pages_;
};

std::string fmt(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

std::string pdf_string(const std::string& ansi) {
    std::string out = "(";
    for (char c : ansi) {
        auto uc = static_cast<unsigned char>(c);
        if (c == '(' || c == ')' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (uc < 32 || uc > 126) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\%03o", uc);
            out += buf;
        } else {
            out.push_back(c);
        }
    }
    out.push_back(')');
    return out;
}

std::string content_stream(const Page& page) {
    std::string out;
    for (const auto& line : page.lines) {
        out += "BT\n/";
        out += line.bold ? "F2 " : "F1 ";
        out += fmt(line.size) + " Tf\n";
        out += "1 0 0 1 " + fmt(line.x) + " " + fmt(line.y) + " Tm\n";
        out += pdf_string(line.text) + " Tj\nET\n";
    }
    return out;
}

// Appends one indirect object and records its byte offset
void write_object(std::string& out, std::vector<size_t>& offsets, size_t id, const std::string& body) {
    offsets[id] = out.size();
    out += std::to_string(id) + " 0 obj\n" + body + "\nendobj\n";
}

} // namespace

std::optional<PaperSize> lookup_paper_size(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "a3") return PaperSize{"a3", 841.89, 1190.55};
    if (lower == "a4") return PaperSize{"a4", 595.28, 841.89};
    if (lower == "a5") return PaperSize{"a5", 419.53, 595.28};
    if (lower == "letter" || lower == "us-letter") return PaperSize{"letter", 612.0, 792.0};
    if (lower == "legal" || lower == "us-legal") return PaperSize{"legal", 612.0, 1008.0};
    return std::nullopt;
}

std::string to_win_ansi(std::string_view utf8) {
    std::string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        auto c = static_cast<unsigned char>(utf8[i]);
        uint32_t cp = 0;
        size_t len = 0;
        if (c < 0x80) {
            cp = c;
            len = 1;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            len = 4;
        } else {
            out.push_back('?');
            ++i;
            continue;
        }
        if (i + len > utf8.size()) {
            out.push_back('?');
            break;
        }
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(utf8[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out.push_back('?');
            ++i;
            continue;
        }
        i += len;

        if (cp < 0x80 || (cp >= 0xA0 && cp <= 0xFF)) {
            out.push_back(static_cast<char>(cp));
            continue;
        }
        switch (cp) {
            case 0x20AC: out.push_back('\x80'); break;
            case 0x2026: out.push_back('\x85'); break;
            case 0x2018: out.push_back('\x91'); break;
            case 0x2019: out.push_back('\x92'); break;
            case 0x201C: out.push_back('\x93'); break;
            case 0x201D: out.push_back('\x94'); break;
            case 0x2022: out.push_back('\x95'); break;
            case 0x2013: out.push_back('\x96'); break;
            case 0x2014: out.push_back('\x97'); break;
            default: out.push_back('?'); break;
        }
    }
    return out;
}

double text_width(std::string_view utf8, double font_size, bool bold) {
    return ansi_width(to_win_ansi(utf8), font_size, bold);
}

Bytes encode_pdf(const Document& doc, const PdfOptions& options) {
    if (options.paper.width_pt <= 2 * kMargin + kListIndent || options.paper.height_pt <= 2 * kMargin) {
        throw EncodeError("Paper size '" + options.paper.name + "' is too small for the page margins");
    }

    Layout layout(options.paper);
    for (const auto& block : doc.blocks) {
        switch (block.kind) {
            case BlockKind::HEADING: layout.heading(to_win_ansi(block.text), block.level); break;
            case BlockKind::PARAGRAPH: layout.paragraph(to_win_ansi(block.text)); break;
            case BlockKind::LIST_ITEM: layout.list_item(to_win_ansi(block.text)); break;
            case BlockKind::PAGE_BREAK: layout.page_break(); break;
        }
    }

    const auto& pages = layout.pages();
    if (options.max_pages > 0 && pages.size() > options.max_pages) {
        throw EncodeError("Document has " + std::to_string(pages.size()) +
                          " pages, limit is " + std::to_string(options.max_pages));
    }

    // 1: regular font, 2: bold font, 3: page tree, 4: catalog, then (content, page) per page
    const size_t object_count = 4 + 2 * pages.size();
    std::vector<size_t> offsets(object_count + 1, 0);

    std::string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    write_object(out, offsets, 1, "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>");
    write_object(out, offsets, 2, "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>");

    std::string kids;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (!kids.empty()) kids += " ";
        kids += std::to_string(6 + 2 * i) + " 0 R";
    }
    write_object(out, offsets, 3, "<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages.size()) + " >>");
    write_object(out, offsets, 4, "<< /Type /Catalog /Pages 3 0 R >>");

    for (size_t i = 0; i < pages.size(); ++i) {
        const size_t content_id = 5 + 2 * i;
        const size_t page_id = content_id + 1;

        std::string stream = content_stream(pages[i]);
        std::string dict = "<< /Length ";
        if (options.compress) {
            std::string compressed;
            std::string error;
            if (deflate_stream(stream, compressed, error)) {
                stream = std::move(compressed);
                dict = "<< /Filter /FlateDecode /Length ";
            } else {
                log_warning("PDF encode: writing page " + std::to_string(i + 1) +
                            " uncompressed (" + error + ")");
            }
        }
        write_object(out, offsets, content_id,
                     dict + std::to_string(stream.size()) + " >>\nstream\n" + stream + "\nendstream");

        write_object(out, offsets, page_id,
                     "<< /Type /Page /Parent 3 0 R /MediaBox [0 0 " + fmt(options.paper.width_pt) + " " +
                     fmt(options.paper.height_pt) + "] /Contents " + std::to_string(content_id) +
                     " 0 R /Resources << /Font << /F1 1 0 R /F2 2 0 R >> >> >>");
    }

    const size_t xref_pos = out.size();
    out += "xref\n0 " + std::to_string(object_count + 1) + "\n0000000000 65535 f \n";
    for (size_t id = 1; id <= object_count; ++id) {
        char entry[24];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offsets[id]);
        out += entry;
    }
    out += "trailer\n<< /Size " + std::to_string(object_count + 1) + " /Root 4 0 R >>\nstartxref\n" +
           std::to_string(xref_pos) + "\n%%EOF\n";

    return Bytes(out.begin(), out.end());
}

} // namespace papermake
