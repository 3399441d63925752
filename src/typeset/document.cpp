// src/typeset/document.cpp
#include "papermake/typeset/document.h"
#include <cctype>

namespace papermake {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Collapses runs of whitespace into single spaces
void append_words(std::string& out, std::string_view text) {
    bool pending_space = !out.empty();
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
}

} // namespace

Document typeset(std::string_view text) {
    Document doc;
    std::string paragraph;

    auto flush_paragraph = [&]() {
        if (!paragraph.empty()) {
            doc.blocks.push_back({BlockKind::PARAGRAPH, 0, std::move(paragraph)});
            paragraph.clear();
        }
    };

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        std::string_view line = trim(text.substr(pos, eol - pos));
        pos = eol + 1;

        if (line.empty()) {
            flush_paragraph();
            continue;
        }

        if (line == "#pagebreak") {
            flush_paragraph();
            doc.blocks.push_back({BlockKind::PAGE_BREAK, 0, {}});
            continue;
        }

        if (line.front() == '=') {
            size_t level = line.find_first_not_of('=');
            if (level != std::string_view::npos && level <= 3 && line[level] == ' ') {
                flush_paragraph();
                std::string heading;
                append_words(heading, line.substr(level + 1));
                doc.blocks.push_back({BlockKind::HEADING, static_cast<int>(level), std::move(heading)});
                continue;
            }
        }

        if (line.size() >= 2 && (line[0] == '-' || line[0] == '*') && line[1] == ' ') {
            flush_paragraph();
            std::string item;
            append_words(item, line.substr(2));
            doc.blocks.push_back({BlockKind::LIST_ITEM, 0, std::move(item)});
            continue;
        }

        append_words(paragraph, line);
    }
    flush_paragraph();
    return doc;
}

} // namespace papermake
