// papermake/typeset/document.h
#ifndef PAPERMAKE_TYPESET_DOCUMENT_H
#define PAPERMAKE_TYPESET_DOCUMENT_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace papermake {

enum class BlockKind : uint8_t {
    HEADING,
    PARAGRAPH,
    LIST_ITEM,
    PAGE_BREAK
};

struct Block {
    BlockKind kind;
    int level = 0;      // 1..3 for headings
    std::string text;   // UTF-8, single spaces, no newlines

    bool operator==(const Block& other) const {
        return kind == other.kind && level == other.level && text == other.text;
    }
};

// Paper-independent result of a compile; pagination happens at encode time
struct Document {
    std::vector<Block> blocks;

    bool empty() const { return blocks.empty(); }
    bool operator==(const Document& other) const { return blocks == other.blocks; }
};

// Line markup of expanded template text:
//   "= ", "== ", "=== "  heading levels 1-3
//   "- " or "* "         list item
//   "#pagebreak"         page break
//   blank line           ends the current paragraph
//   other lines          paragraph text, consecutive lines are joined
Document typeset(std::string_view text);

} // namespace papermake

#endif // PAPERMAKE_TYPESET_DOCUMENT_H
